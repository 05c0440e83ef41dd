/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_TEST_SUPPORT_HPP
#define IPTV_TEST_SUPPORT_HPP

#pragma once

#include <channel.hpp>
#include <process.hpp>
#include <task.hpp>
#include <translator.hpp>

#include <algorithm>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace iptv::testing {

    using json = nlohmann::json;
    using std::chrono::milliseconds;

    /// Linux wait(2) encoding of a normal exit with `code`.
    inline int exited_with(int code) { return (code & 0xff) << 8; }

/**
 * @brief Virtual time: wait_until() jumps straight to the deadline instead of sleeping.
 */
    class ManualClock : public task::Clock {
    public:
        ManualClock() : now_(task::TimePoint() + std::chrono::hours(1)), waits(0) {}

        task::TimePoint now() const override { return now_; }

        void wait_until(std::vector<pollfd> &, task::TimePoint deadline) override {
            ++waits;
            if (deadline != task::TimePoint::max() && deadline > now_) now_ = deadline;
        }

        void advance(milliseconds d) { now_ += d; }

        milliseconds since(task::TimePoint start) const {
            return std::chrono::duration_cast<milliseconds>(now_ - start);
        }

        task::TimePoint now_;
        int waits;
    };

/**
 * @brief Scripted mpv: answers the JSON IPC requests the translator produces.
 */
    struct FakePlayer {
        bool answering = true;          // false: swallow requests (caller times out)
        bool reset = false;             // drop the connection on the next request
        bool reject_load = false;
        bool chatty = false;            // emit an event line before every reply
        std::set<std::string> silent;   // commands that never get a reply
        std::string now_playing;
        std::vector<std::string> commands;

        static constexpr const char *RESET = "\x01reset";

        std::string handle(const json &req) {
            const std::string cmd = req["command"][0].get<std::string>();
            commands.push_back(cmd);
            if (reset) return RESET;
            if (!answering || silent.count(cmd)) return {};

            json reply;
            reply["request_id"] = req["request_id"];
            reply["error"] = "success";
            if (cmd == "loadfile") {
                if (reject_load) {
                    reply["error"] = "loading failed";
                } else {
                    now_playing = req["command"][1].get<std::string>();
                }
            } else if (cmd == "stop") {
                now_playing.clear();
            } else if (cmd == "get_property") {
                if (now_playing.empty()) {
                    reply["error"] = "property unavailable";
                } else {
                    reply["data"] = now_playing;
                }
            }
            std::string out;
            if (chatty) out += "{\"event\":\"playback-restart\"}\n";
            return out + reply.dump() + "\n";
        }
    };

/**
 * @brief In-memory stream. Without a player it serves `script` verbatim.
 */
    class FakeStream : public channel::Stream {
    public:
        explicit FakeStream(std::shared_ptr<FakePlayer> player) : player_(std::move(player)), closed_(false) {}

        channel::IoResult send_some(const char *buf, size_t len, size_t &sent) override {
            sent = 0;
            if (closed_) return channel::IoResult::Closed;
            written.append(buf, len);
            sent = len;
            size_t nl;
            while ((nl = written.find('\n')) != std::string::npos) {
                std::string line = written.substr(0, nl);
                written.erase(0, nl + 1);
                lines.push_back(line);
                if (!player_) continue;
                std::string reply = player_->handle(json::parse(line));
                if (reply == FakePlayer::RESET) {
                    closed_ = true;
                } else {
                    incoming += reply;
                }
            }
            return channel::IoResult::Done;
        }

        channel::IoResult recv_some(char *buf, size_t len, size_t &got) override {
            got = 0;
            if (incoming.empty()) {
                return closed_ ? channel::IoResult::Closed : channel::IoResult::WouldBlock;
            }
            got = std::min(len, incoming.size());
            std::memcpy(buf, incoming.data(), got);
            incoming.erase(0, got);
            return channel::IoResult::Done;
        }

        void close() { closed_ = true; }

        std::string written;
        std::string incoming;
        std::vector<std::string> lines;

    private:
        std::shared_ptr<FakePlayer> player_;
        bool closed_;
    };

    struct FakeEndpoint {
        channel::ConnectAttempt state = channel::ConnectAttempt::Connected;
        int absent_attempts = 0;   // report Absent this many times first
        std::shared_ptr<FakePlayer> player;
    };

    class FakeConnector : public channel::Connector {
    public:
        channel::ConnectAttempt try_connect(const std::string &address, std::unique_ptr<channel::Stream> &out,
                                            std::string &why) override {
            ++attempts;
            auto it = endpoints.find(address);
            if (it == endpoints.end()) {
                why = "no such endpoint";
                return channel::ConnectAttempt::Absent;
            }
            FakeEndpoint &ep = it->second;
            if (ep.absent_attempts > 0) {
                --ep.absent_attempts;
                why = "not yet";
                return channel::ConnectAttempt::Absent;
            }
            if (ep.state != channel::ConnectAttempt::Connected) {
                why = "scripted failure";
                return ep.state;
            }
            out.reset(new FakeStream(ep.player));
            return channel::ConnectAttempt::Connected;
        }

        void remove_endpoint(const std::string &address) override {
            removed.push_back(address);
            endpoints.erase(address);
        }

        std::map<std::string, FakeEndpoint> endpoints;
        std::vector<std::string> removed;
        int attempts = 0;
    };

/**
 * @brief Supervisor with scripted process states. Exited processes report once, then are Gone.
 */
    class FakeSupervisor : public process::Supervisor {
    public:
        SpawnError launch(const protocol::SpawnCommand &cmd, pid_t &pid, int &wait_status,
                          std::string &why) override {
            launches.push_back(cmd);
            pid = -1;
            wait_status = 0;
            if (next_error != SpawnError::None) {
                why = "scripted spawn failure";
                return next_error;
            }
            pid = next_pid++;
            states[pid] = process::ProcessState::Running;
            if (cmd.mode == playback::PlaybackMode::Terminal) {
                wait_status = terminal_status;
                states[pid] = process::ProcessState::Gone;
            }
            if (on_launch) on_launch(cmd, pid);
            return SpawnError::None;
        }

        process::ProcessState check(pid_t pid, int &wait_status) override {
            ++checks;
            auto it = states.find(pid);
            if (it == states.end()) return process::ProcessState::Gone;
            if (it->second == process::ProcessState::Exited) {
                wait_status = exit_status[pid];
                it->second = process::ProcessState::Gone;
                return process::ProcessState::Exited;
            }
            return it->second;
        }

        void terminate(pid_t pid) override {
            terminated.push_back(pid);
            states[pid] = process::ProcessState::Gone;
        }

        void reap() override { ++reaps; }

        void exit(pid_t pid, int status) {
            states[pid] = process::ProcessState::Exited;
            exit_status[pid] = status;
        }

        void run(pid_t pid) { states[pid] = process::ProcessState::Running; }

        bool was_terminated(pid_t pid) const {
            return std::find(terminated.begin(), terminated.end(), pid) != terminated.end();
        }

        SpawnError next_error = SpawnError::None;
        int terminal_status = 0;
        pid_t next_pid = 1000;
        std::function<void(const protocol::SpawnCommand &, pid_t)> on_launch;

        std::vector<protocol::SpawnCommand> launches;
        std::map<pid_t, process::ProcessState> states;
        std::map<pid_t, int> exit_status;
        std::vector<pid_t> terminated;
        int reaps = 0;
        int checks = 0;
    };

} // namespace iptv::testing

#endif // IPTV_TEST_SUPPORT_HPP
