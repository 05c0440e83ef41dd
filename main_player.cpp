/*
* @license
* (C) zachbabanov
*
*/

#include <channel.hpp>
#include <common.hpp>
#include <config.hpp>
#include <logger.hpp>
#include <player.hpp>
#include <process.hpp>
#include <registry.hpp>
#include <task.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

using namespace iptv;
using namespace iptv::log;
using namespace iptv::playback;

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--player <binary>] [--log <log_file>] [--log-level trace|debug|info|warn|error] <command>\n";
    std::cerr << "Commands:\n";
    std::cerr << "  play [--mode background|terminal|detached|disassociated] [--title <title>] [--kind live|movie|episode] <url>\n";
    std::cerr << "  stop\n";
    std::cerr << "  status\n";
    std::cerr << "  shell      read commands (play/stop/status/now/quit) from stdin\n";
    std::cerr << "Without --config, config.json next to the binary is used when present.\n";
    std::cerr << "Example: " << prog << " play --title \"News HD\" --kind live http://provider:8080/live/user/pass/1234.m3u8\n";
}

namespace {

    struct PlayArgs {
        PlaybackMode mode = PlaybackMode::Background;
        std::string title;
        MediaKind kind = MediaKind::Unknown;
        std::string url;
    };

    bool parse_play_args(const std::vector<std::string> &args, size_t from, PlayArgs &out, std::string &error) {
        for (size_t i = from; i < args.size(); ++i) {
            const std::string &a = args[i];
            if (a == "--mode" || a == "--title" || a == "--kind") {
                if (i + 1 >= args.size()) {
                    error = a + " requires a value";
                    return false;
                }
                const std::string &v = args[++i];
                if (a == "--mode" && !parse_mode(v, out.mode)) {
                    error = "unknown mode '" + v + "'";
                    return false;
                }
                if (a == "--kind" && !parse_kind(v, out.kind)) {
                    error = "unknown kind '" + v + "'";
                    return false;
                }
                if (a == "--title") out.title = v;
            } else if (out.url.empty()) {
                out.url = a;
            } else {
                error = "unexpected argument '" + a + "'";
                return false;
            }
        }
        if (out.url.empty()) {
            error = "play requires a url";
            return false;
        }
        return true;
    }

    std::vector<std::string> split_words(const std::string &line) {
        std::vector<std::string> words;
        std::istringstream iss(line);
        std::string w;
        while (iss >> w) words.push_back(w);
        return words;
    }

    void print_status(const PlaybackStatus &st) {
        switch (st.kind) {
            case StatusKind::Idle:
                std::cout << "idle\n";
                break;
            case StatusKind::Playing:
                std::cout << "playing " << st.url << "\n";
                break;
            case StatusKind::Unknown:
                std::cout << "unknown (player not answering)\n";
                break;
        }
    }

    void report_exit(player::PlayerFacade &facade) {
        std::string msg = facade.take_exit_message();
        if (!msg.empty()) std::cout << msg << "\n";
    }

    int run_play(player::PlayerFacade &facade, task::Scheduler &sched, const PlayArgs &pa) {
        auto op = facade.play(PlaybackTarget(pa.url, pa.title, pa.kind), pa.mode);
        sched.run_until_done(op);
        report_exit(facade);
        if (!op->ok()) {
            std::cerr << "play: " << to_string(op->error()) << "\n";
            return 2;
        }
        std::cout << to_string(op->outcome()) << "\n";
        if (op->outcome() == PlaybackOutcome::Finished && op->exit_code() != 0 && op->exit_code() != 4) return 3;
        return 0;
    }

    int run_stop(player::PlayerFacade &facade, task::Scheduler &sched) {
        auto op = facade.stop();
        sched.run_until_done(op);
        report_exit(facade);
        if (!op->ok()) {
            std::cerr << "stop: " << to_string(op->error()) << "\n";
            return 2;
        }
        std::cout << (op->noop() ? "nothing to stop" : "stopped") << "\n";
        return 0;
    }

    int run_status(player::PlayerFacade &facade, task::Scheduler &sched) {
        auto op = facade.status();
        sched.run_until_done(op);
        report_exit(facade);
        print_status(op->status());
        return 0;
    }

    /**
     * @brief Interactive loop: stdin and the scheduler share one poll().
     *
     * Commands start tasks and return immediately; results are printed when the tasks finish,
     * so "status" keeps answering while a "play" waits for the player to come up.
     */
    int run_shell(player::PlayerFacade &facade, task::Scheduler &sched) {
        struct Pending {
            std::string label;
            std::shared_ptr<player::Operation> op;
        };
        std::vector<Pending> pending;
        bool input_open = true;
        // stdin is only read after poll() says so; a half-typed line must not stall the tasks
        common::LineReader reader(STDIN_FILENO);

        // returns false on quit
        auto handle_line = [&](const std::string &line) {
            std::vector<std::string> words = split_words(line);
            if (words.empty()) return true;
            const std::string &cmd = words[0];
            if (cmd == "quit" || cmd == "exit") {
                return false;
            } else if (cmd == "play") {
                PlayArgs pa;
                std::string error;
                if (!parse_play_args(words, 1, pa, error)) {
                    std::cout << "play: " << error << "\n";
                } else {
                    auto op = facade.play(PlaybackTarget(pa.url, pa.title, pa.kind), pa.mode);
                    sched.submit(op);
                    pending.push_back(Pending{"play", op});
                }
            } else if (cmd == "stop") {
                auto op = facade.stop();
                sched.submit(op);
                pending.push_back(Pending{"stop", op});
            } else if (cmd == "status") {
                auto op = facade.status();
                sched.submit(op);
                pending.push_back(Pending{"status", op});
            } else if (cmd == "now") {
                auto cur = facade.current();
                if (!cur) {
                    std::cout << "no player\n";
                } else {
                    std::cout << "player id=" << cur->id << " " << to_string(cur->ownership)
                              << " endpoint=" << cur->channel_address
                              << " playing=" << (cur->now_playing.empty() ? "-" : cur->now_playing) << "\n";
                }
            } else {
                std::cout << "unknown command '" << cmd << "' (play/stop/status/now/quit)\n";
            }
            return true;
        };

        std::cout << "> " << std::flush;
        while (input_open || !sched.idle()) {
            sched.tick();

            for (auto it = pending.begin(); it != pending.end();) {
                if (!it->op->done()) {
                    ++it;
                    continue;
                }
                if (!it->op->ok()) {
                    std::cout << it->label << ": " << to_string(it->op->error()) << "\n";
                } else if (auto p = std::dynamic_pointer_cast<player::PlayTask>(it->op)) {
                    std::cout << it->label << ": " << to_string(p->outcome()) << "\n";
                } else if (auto s = std::dynamic_pointer_cast<player::StatusTask>(it->op)) {
                    print_status(s->status());
                } else if (auto st = std::dynamic_pointer_cast<player::StopTask>(it->op)) {
                    std::cout << (st->noop() ? "nothing to stop" : "stopped") << "\n";
                }
                report_exit(facade);
                it = pending.erase(it);
            }
            if (!input_open) {
                sched.wait();
                continue;
            }

            std::vector<pollfd> fds = sched.wait_fds();
            pollfd in{};
            in.fd = STDIN_FILENO;
            in.events = POLLIN;
            fds.push_back(in);

            int timeout_ms = -1;
            if (!sched.idle()) {
                auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
                        sched.next_wake() - sched.clock().now()).count();
                timeout_ms = (int)std::max<long long>(0, std::min<long long>(wait + 1, 60000));
            }
            int r = ::poll(fds.data(), fds.size(), timeout_ms);
            if (r < 0) {
                if (errno == EINTR) continue;
                LOG_GEN_ERROR("poll failed: {}", strerror(errno));
                return 1;
            }
            if (!(fds.back().revents & (POLLIN | POLLHUP | POLLERR))) continue;

            const bool more = reader.fill();
            std::string line;
            while (input_open && reader.next(line)) {
                input_open = handle_line(line);
                std::cout << "> " << std::flush;
            }
            if (!more) input_open = false;
        }
        facade.shutdown();
        return 0;
    }

} // namespace

int main(int argc, char **argv) {
    std::string config_cli;
    std::string player_cli;
    std::string log_file_cli;
    std::string log_level_cli;
    std::vector<std::string> pos;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (!pos.empty()) {
            // everything after the command belongs to it
            pos.push_back(a);
        } else if (a == "--config") {
            if (i + 1 >= argc) { std::cerr << "--config requires a path\n"; return 1; }
            config_cli = argv[++i];
        } else if (a == "--player") {
            if (i + 1 >= argc) { std::cerr << "--player requires a binary\n"; return 1; }
            player_cli = argv[++i];
        } else if (a == "--log") {
            if (i + 1 >= argc) { std::cerr << "--log requires a path\n"; return 1; }
            log_file_cli = argv[++i];
        } else if (a == "--log-level") {
            if (i + 1 >= argc) { std::cerr << "--log-level requires a value\n"; return 1; }
            log_level_cli = argv[++i];
        } else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            pos.push_back(a);
        }
    }
    if (pos.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    config::PlayerConfig cfg;
    std::string config_path = config_cli;
    if (config_path.empty()) {
        std::string candidate = common::joinPath(common::exeDirectory(argc > 0 ? argv[0] : nullptr), "config.json");
        if (common::fileExists(candidate)) config_path = candidate;
    }
    if (!config_path.empty()) {
        std::string error;
        if (!config::load_config(config_path, cfg, error)) {
            std::cerr << "Warning: " << error << " - using defaults\n";
        }
    }

    // CLI overrides config
    if (!player_cli.empty()) cfg.binary = player_cli;
    if (!log_file_cli.empty()) cfg.log_file = log_file_cli;
    if (!log_level_cli.empty()) cfg.log_level = log_level_cli;

    Level level = Level::INFO;
    if (!cfg.log_level.empty() && !parse_level(cfg.log_level, level)) {
        std::cerr << "Warning: unknown log level '" << cfg.log_level << "', using info\n";
    }
    Logger::instance().set_level(level);
    if (!cfg.log_file.empty()) {
        if (!Logger::instance().open_logfile(cfg.log_file)) {
            std::cerr << "Warning: cannot open log file " << cfg.log_file << "\n";
        }
    }

    const std::string &cmd = pos[0];
    if (cmd == "shell" && !cfg.log_file.empty()) {
        // keep the prompt readable; the log file still gets everything
        Logger::instance().set_console(false);
    }

    task::SystemClock clock;
    task::Scheduler sched(clock);
    process::ProcessSupervisor supervisor;
    channel::UnixConnector connector;
    player::PlayerFacade facade(cfg, clock, supervisor, connector, registry::InstanceRegistry::global());

    LOG_GEN_DEBUG("Player binary '{}', control endpoint '{}'", cfg.binary, cfg.endpoint_path());

    // a player left running by an earlier invocation is picked up here
    auto discover = facade.discover();
    sched.run_until_done(discover);
    if (!discover->ok()) {
        LOG_GEN_WARN("Player discovery failed: {}", to_string(discover->error()));
    }

    int rc = 1;
    if (cmd == "play") {
        PlayArgs pa;
        std::string error;
        if (!parse_play_args(pos, 1, pa, error)) {
            std::cerr << "play: " << error << "\n";
            print_usage(argv[0]);
        } else {
            rc = run_play(facade, sched, pa);
        }
    } else if (cmd == "stop") {
        rc = run_stop(facade, sched);
    } else if (cmd == "status") {
        rc = run_status(facade, sched);
    } else if (cmd == "shell") {
        rc = run_shell(facade, sched);
    } else {
        std::cerr << "Unknown command '" << cmd << "'\n";
        print_usage(argv[0]);
    }

    Logger::instance().close_logfile();
    return rc;
}
