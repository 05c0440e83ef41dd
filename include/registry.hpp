/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_REGISTRY_HPP
#define IPTV_REGISTRY_HPP

#pragma once

#include <channel.hpp>
#include <config.hpp>
#include <errors.hpp>
#include <playback.hpp>
#include <process.hpp>
#include <task.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace iptv::registry {

/**
 * @brief The single "current player" slot.
 *
 * Readers take a shared lock and receive a copy, so nobody observes a half-updated instance.
 * Writers take the exclusive lock. clear_if() evicts only the instance a caller actually probed:
 * if another operation already replaced it, the newer entry survives.
 */
    class InstanceRegistry {
    public:
        InstanceRegistry();

        /// Process-wide registry, created on first use.
        static InstanceRegistry &global();

        std::optional<playback::PlayerInstance> current() const;

        /**
         * Store inst as the current instance. An id of 0 is replaced by a fresh one; returns the id.
         * An instance whose `live` flag is not set was never verified and is refused: the slot is
         * left as it was and 0 is returned.
         */
        uint64_t set(playback::PlayerInstance inst);

        void clear();

        /// Clear the slot only if it still holds instance `id`.
        bool clear_if(uint64_t id);

        /// Record what instance `id` is playing (empty = idle). No-op if the slot moved on.
        void set_now_playing(uint64_t id, const std::string &url);

    private:
        mutable std::shared_mutex mtx_;
        std::optional<playback::PlayerInstance> slot_;
        uint64_t last_id_;

        InstanceRegistry(const InstanceRegistry&) = delete;
        InstanceRegistry& operator=(const InstanceRegistry&) = delete;
    };

/**
 * @brief probe_liveness(): decide whether the registered instance may be used right now.
 *
 * Instances with a channel get a connect (single attempt) plus a QueryStatus round-trip;
 * owned instances without a channel get an OS-level check. Any failure evicts the instance
 * from the registry before the probe completes.
 *
 * On success the connected channel is kept and can be taken over by the caller, so the real
 * command follows the probe without another connect.
 */
    class LivenessProbe : public task::Task {
    public:
        LivenessProbe(task::Clock &clock, const config::PlayerConfig &cfg, InstanceRegistry &registry,
                      process::Supervisor &supervisor, channel::Connector &connector);

        const char *name() const override { return "liveness-probe"; }

        /// False when the registry was empty or the instance failed the probe.
        bool live() const { return live_; }
        bool evicted() const { return evicted_; }

        /// The instance that was probed (empty if the registry was empty).
        const std::optional<playback::PlayerInstance> &instance() const { return instance_; }

        /// QueryStatus result for live channel instances.
        const playback::PlaybackStatus &status() const { return status_; }

        /// Evicted owned instance whose process is still running.
        bool process_alive() const { return process_alive_; }

        /// Why an owned process went away ("exited with code 2"), empty otherwise.
        const std::string &exit_message() const { return exit_message_; }

        /// Failure that caused the eviction.
        const PlayError &error() const { return error_; }

        std::unique_ptr<channel::Channel> take_channel() { return std::move(channel_); }

    protected:
        task::Poll step() override;

    private:
        enum class State {
            Start,
            Connecting,
            Querying
        };

        task::Poll evict(PlayError why);
        task::Poll check_process();

        const config::PlayerConfig &cfg_;
        InstanceRegistry &registry_;
        process::Supervisor &supervisor_;
        channel::Connector &connector_;

        State state_;
        std::optional<playback::PlayerInstance> instance_;
        std::shared_ptr<channel::ConnectTask> connect_;
        std::shared_ptr<channel::RequestTask> query_;
        std::unique_ptr<channel::Channel> channel_;

        bool live_;
        bool evicted_;
        bool process_alive_;
        playback::PlaybackStatus status_;
        std::string exit_message_;
        PlayError error_;
    };

} // namespace iptv::registry

#endif // IPTV_REGISTRY_HPP
