/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_PROCESS_HPP
#define IPTV_PROCESS_HPP

#pragma once

#include <errors.hpp>
#include <task.hpp>
#include <translator.hpp>

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace iptv::process {

    enum class ProcessState {
        Running,
        Exited,   // reaped; status filled
        Gone      // not (or no longer) observable
    };

    /// "exited normally (status: 0)", "exited with code N", "terminated by signal N"
    std::string describe_status(int wait_status);

    /// Exit code for ImmediateExit reporting: WEXITSTATUS, 128+signal, or -1.
    int exit_code_of(int wait_status);

/**
 * @brief OS process layer. Implementations must not block, except launch() in Terminal mode.
 */
    class Supervisor {
    public:
        virtual ~Supervisor() = default;

        /**
         * @brief Start cmd.binary with cmd.args according to cmd.mode.
         *
         * Terminal: inherits stdio and waits; wait_status receives the child's status.
         * Background/Detached: our child, stdio redirected to /dev/null.
         * Disassociated: own session, reparented away from us; pid is the player's pid.
         */
        virtual SpawnError launch(const protocol::SpawnCommand &cmd, pid_t &pid, int &wait_status,
                                  std::string &why) = 0;

        /// Non-blocking liveness check. Reaps our children when they have exited.
        virtual ProcessState check(pid_t pid, int &wait_status) = 0;

        /// Ask the process to exit (SIGTERM) and reap it when possible.
        virtual void terminate(pid_t pid) = 0;

        /// Collect exited Detached children and terminated processes. Never blocks.
        virtual void reap() = 0;
    };

/**
 * @brief fork/execvp based supervisor.
 *
 * Exec failures are reported through a close-on-exec pipe: EOF means the exec succeeded,
 * an errno value means it did not (ENOENT -> BinaryNotFound).
 */
    class ProcessSupervisor : public Supervisor {
    public:
        ProcessSupervisor() = default;
        ~ProcessSupervisor() override;

        SpawnError launch(const protocol::SpawnCommand &cmd, pid_t &pid, int &wait_status,
                          std::string &why) override;
        ProcessState check(pid_t pid, int &wait_status) override;
        void terminate(pid_t pid) override;
        void reap() override;

    private:
        SpawnError launch_child(const protocol::SpawnCommand &cmd, pid_t &pid, std::string &why);
        SpawnError launch_disassociated(const protocol::SpawnCommand &cmd, pid_t &pid, std::string &why);
        SpawnError wait_foreground(pid_t pid, int &wait_status, std::string &why);

        std::vector<pid_t> unsupervised_; // children we no longer watch but must reap
    };

/**
 * @brief Bounded wait after a spawn: Ready once the confirmation window passed with the
 *        process still alive (error() == None) or as soon as it exits (ImmediateExit).
 */
    class SpawnConfirmTask : public task::Task {
    public:
        SpawnConfirmTask(task::Clock &clock, Supervisor &supervisor, pid_t pid,
                         std::chrono::milliseconds window, std::chrono::milliseconds poll_interval);

        const char *name() const override { return "spawn-confirm"; }

        SpawnError error() const { return error_; }
        int exit_code() const { return exit_code_; }
        const std::string &detail() const { return detail_; }

    protected:
        task::Poll step() override;

    private:
        Supervisor &supervisor_;
        pid_t pid_;
        std::chrono::milliseconds window_;
        std::chrono::milliseconds poll_interval_;
        bool started_;
        task::TimePoint deadline_;
        SpawnError error_;
        int exit_code_;
        std::string detail_;
    };

} // namespace iptv::process

#endif // IPTV_PROCESS_HPP
