/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_PLAYER_HPP
#define IPTV_PLAYER_HPP

#pragma once

#include <channel.hpp>
#include <config.hpp>
#include <errors.hpp>
#include <playback.hpp>
#include <process.hpp>
#include <registry.hpp>
#include <task.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace iptv::player {

    class PlayerFacade;

/**
 * @brief Common base of facade operations: a task with a typed result.
 *
 * Operations that change the current instance (Background play, stop, discover) are
 * serialized: each waits until every earlier one has finished before it looks at the registry.
 */
    class Operation : public task::Task {
    public:
        bool ok() const { return !failed_; }
        const PlayError &error() const { return error_; }

    protected:
        explicit Operation(PlayerFacade &facade);

        task::Poll fail(PlayError e);

        /// True once it is this operation's turn; otherwise arranges to wake with the blocker.
        bool acquire_slot();

        PlayerFacade &facade_;

    private:
        friend class PlayerFacade;

        bool serialized_;
        bool failed_;
        PlayError error_;
    };

/**
 * @brief Look for a player already listening on the well-known endpoint.
 *
 * A responding player is registered as a Discovered instance. An endpoint file nobody listens
 * on is removed. Does nothing when an instance is already registered.
 */
    class DiscoverTask : public Operation {
    public:
        explicit DiscoverTask(PlayerFacade &facade);

        const char *name() const override { return "discover"; }

        bool found() const { return found_; }
        bool stale_removed() const { return stale_removed_; }
        const playback::PlayerInstance &instance() const { return instance_; }

        std::unique_ptr<channel::Channel> take_channel() { return std::move(channel_); }

    protected:
        task::Poll step() override;

    private:
        enum class State {
            Start,
            Connecting,
            Querying
        };

        State state_;
        std::string address_;
        std::shared_ptr<channel::ConnectTask> connect_;
        std::shared_ptr<channel::RequestTask> query_;
        std::unique_ptr<channel::Channel> channel_;
        bool found_;
        bool stale_removed_;
        playback::PlayerInstance instance_;
    };

/**
 * @brief play(target, mode).
 *
 * Background: reuse the live registered (or discovered) player via LoadFile, else spawn one,
 * wait for its endpoint, register it and send LoadFile.
 * Terminal: spawn and wait in the foreground; the only operation that blocks.
 * Detached / Disassociated: spawn and confirm it survived the confirmation window.
 */
    class PlayTask : public Operation {
    public:
        PlayTask(PlayerFacade &facade, playback::PlaybackTarget target, playback::PlaybackMode mode);

        const char *name() const override { return "play"; }

        playback::PlaybackOutcome outcome() const { return outcome_; }
        playback::PlaybackMode mode() const { return mode_; }
        const playback::PlaybackTarget &target() const { return target_; }

        /// Exit code of a Terminal player (0 and 4 are normal ends).
        int exit_code() const { return exit_code_; }

    protected:
        task::Poll step() override;

    private:
        enum class State {
            Start,
            Queued,
            Probing,
            Discovering,
            Spawning,
            AwaitEndpoint,
            Loading,
            Launching,
            Confirming
        };

        task::Poll spawn_background();
        task::Poll await_endpoint();
        task::Poll launch_unmanaged();
        void start_load();

        playback::PlaybackTarget target_;
        playback::PlaybackMode mode_;
        State state_;

        std::shared_ptr<registry::LivenessProbe> probe_;
        std::shared_ptr<DiscoverTask> discover_;
        std::shared_ptr<channel::ConnectTask> connect_;
        std::shared_ptr<channel::RequestTask> load_;
        std::shared_ptr<process::SpawnConfirmTask> confirm_;
        std::unique_ptr<channel::Channel> channel_;

        playback::PlayerInstance instance_;
        std::string endpoint_;
        pid_t pid_;
        playback::PlaybackOutcome outcome_;
        int exit_code_;
    };

/**
 * @brief stop(): Stop on the live current instance; success without side effects when there is none.
 */
    class StopTask : public Operation {
    public:
        explicit StopTask(PlayerFacade &facade);

        const char *name() const override { return "stop"; }

        /// True when there was nothing live to stop.
        bool noop() const { return noop_; }

    protected:
        task::Poll step() override;

    private:
        enum class State {
            Start,
            Queued,
            Probing,
            Stopping
        };

        State state_;
        std::shared_ptr<registry::LivenessProbe> probe_;
        std::shared_ptr<channel::RequestTask> request_;
        std::unique_ptr<channel::Channel> channel_;
        playback::PlayerInstance instance_;
        bool noop_;
    };

/**
 * @brief status(): Idle, Playing(url) or Unknown (channel gone, process still there).
 */
    class StatusTask : public Operation {
    public:
        explicit StatusTask(PlayerFacade &facade);

        const char *name() const override { return "status"; }

        const playback::PlaybackStatus &status() const { return status_; }

    protected:
        task::Poll step() override;

    private:
        std::shared_ptr<registry::LivenessProbe> probe_;
        bool started_;
        playback::PlaybackStatus status_;
    };

/**
 * @brief Single entry point of the playback core.
 *
 * play()/stop()/status()/discover() return tasks the caller drives through a task::Scheduler
 * (or polls itself). The facade must outlive the tasks it hands out.
 */
    class PlayerFacade {
    public:
        PlayerFacade(const config::PlayerConfig &cfg, task::Clock &clock, process::Supervisor &supervisor,
                     channel::Connector &connector, registry::InstanceRegistry &registry);

        std::shared_ptr<PlayTask> play(const playback::PlaybackTarget &target, playback::PlaybackMode mode);
        std::shared_ptr<StopTask> stop();
        std::shared_ptr<StatusTask> status();
        std::shared_ptr<DiscoverTask> discover();

        /// Terminate an owned Background player and remove its endpoint. Discovered players keep running.
        void shutdown();

        /// Last "player exited ..." message, returned once.
        std::string take_exit_message();

        std::optional<playback::PlayerInstance> current() const { return registry_.current(); }

        const config::PlayerConfig &config() const { return cfg_; }

    private:
        friend class Operation;
        friend class DiscoverTask;
        friend class PlayTask;
        friend class StopTask;
        friend class StatusTask;

        template<typename T>
        std::shared_ptr<T> serialize(std::shared_ptr<T> op);

        std::shared_ptr<task::Task> slot_blocker(const task::Task *op);

        std::shared_ptr<registry::LivenessProbe> make_probe();

        /// Reap finished children and forget orphans that exited.
        void housekeeping();

        /// Drop inst from the registry after a channel failure, keeping track of its process.
        void evict(const playback::PlayerInstance &inst, const PlayError &why);

        /// Take over the process bookkeeping of a failed probe.
        void absorb(const registry::LivenessProbe &probe);

        /// Clear an owned registered instance only if its process is confirmed dead.
        void forget_dead_instance();

        void terminate_orphans();
        void note_exit(const std::string &msg);

        const config::PlayerConfig &cfg_;
        task::Clock &clock_;
        process::Supervisor &supervisor_;
        channel::Connector &connector_;
        registry::InstanceRegistry &registry_;

        std::deque<std::weak_ptr<task::Task>> slot_queue_;
        std::vector<pid_t> orphans_;   // evicted owned players whose process still ran
        std::string exit_message_;
    };

} // namespace iptv::player

#endif // IPTV_PLAYER_HPP
