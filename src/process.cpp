/*
* @license
* (C) zachbabanov
*
*/

#include <process.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

using namespace iptv::common;
using namespace iptv::log;
using namespace iptv::playback;
using iptv::task::Poll;

/*
 * Implementation notes:
 * - argv is built before fork(); the child only calls async-signal-safe functions.
 * - The status pipe is O_CLOEXEC on both ends: a successful exec closes the child's end and
 *   the parent reads EOF; a failed exec writes a StatusMsg first.
 * - Disassociated mode double-forks: the intermediate child calls setsid(), forks the player,
 *   reports the player's pid through the same pipe and exits at once, so the player is
 *   reparented to init (or the nearest subreaper) and never becomes our zombie.
 */

namespace iptv::process {

    namespace {

        struct StatusMsg {
            int32_t tag;    // 'P' = player pid follows, 'E' = errno follows
            int32_t value;
        };

        std::vector<char*> build_argv(const std::string &cmd, const std::vector<std::string> &args) {
            std::vector<char*> argv;
            argv.push_back(const_cast<char*>(cmd.c_str()));
            for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
            argv.push_back(nullptr);
            return argv;
        }

        // child side only
        void write_status(int fd, int32_t tag, int32_t value) {
            StatusMsg m{tag, value};
            ssize_t n;
            do { n = ::write(fd, &m, sizeof(m)); } while (n < 0 && errno == EINTR);
        }

        // child side only
        void redirect_stdio_to_null() {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull < 0) return;
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        SpawnError spawn_error_from_errno(int e) {
            return (e == ENOENT || e == ENOTDIR) ? SpawnError::BinaryNotFound : SpawnError::IoFailure;
        }

        pid_t wait_blocking(pid_t pid, int &status) {
            pid_t r;
            do { r = waitpid(pid, &status, 0); } while (r < 0 && errno == EINTR);
            return r;
        }

    } // namespace

    std::string describe_status(int wait_status) {
        if (WIFEXITED(wait_status)) {
            int code = WEXITSTATUS(wait_status);
            if (code == 0) return "exited normally (status: 0)";
            return fmt::format("exited with code {}", code);
        }
        if (WIFSIGNALED(wait_status)) return fmt::format("terminated by signal {}", WTERMSIG(wait_status));
        return "state unknown";
    }

    int exit_code_of(int wait_status) {
        if (WIFEXITED(wait_status)) return WEXITSTATUS(wait_status);
        if (WIFSIGNALED(wait_status)) return 128 + WTERMSIG(wait_status);
        return -1;
    }

    ProcessSupervisor::~ProcessSupervisor() {
        reap();
    }

    SpawnError ProcessSupervisor::launch(const protocol::SpawnCommand &cmd, pid_t &pid, int &wait_status,
                                         std::string &why) {
        pid = -1;
        wait_status = 0;
        SpawnError err = cmd.mode == PlaybackMode::Disassociated
                         ? launch_disassociated(cmd, pid, why)
                         : launch_child(cmd, pid, why);
        if (err != SpawnError::None) {
            LOG_PROC_ERROR("Player spawn failed: cmd='{}' mode={} err={} ({})", cmd.binary, to_string(cmd.mode),
                           iptv::to_string(err), why);
            return err;
        }
        LOG_PROC_INFO("Player started: cmd='{}' mode={} pid={}", cmd.binary, to_string(cmd.mode), (int)pid);

        switch (cmd.mode) {
            case PlaybackMode::Terminal:
                return wait_foreground(pid, wait_status, why);
            case PlaybackMode::Detached:
                unsupervised_.push_back(pid);
                break;
            case PlaybackMode::Background:
            case PlaybackMode::Disassociated:
                break;
        }
        return SpawnError::None;
    }

    SpawnError ProcessSupervisor::launch_child(const protocol::SpawnCommand &cmd, pid_t &pid, std::string &why) {
        std::vector<char*> argv = build_argv(cmd.binary, cmd.args);

        int pipefd[2];
        if (pipe2(pipefd, O_CLOEXEC) != 0) {
            why = std::string("pipe failed: ") + strerror(errno);
            return SpawnError::IoFailure;
        }

        pid_t child = fork();
        if (child < 0) {
            why = std::string("fork failed: ") + strerror(errno);
            close(pipefd[0]);
            close(pipefd[1]);
            return SpawnError::IoFailure;
        }
        if (child == 0) {
            close(pipefd[0]);
            if (cmd.mode != PlaybackMode::Terminal) redirect_stdio_to_null();
            execvp(cmd.binary.c_str(), argv.data());
            write_status(pipefd[1], 'E', errno);
            _exit(127);
        }

        close(pipefd[1]);
        StatusMsg msg{0, 0};
        ssize_t n;
        do { n = ::read(pipefd[0], &msg, sizeof(msg)); } while (n < 0 && errno == EINTR);
        close(pipefd[0]);

        if (n == (ssize_t)sizeof(msg) && msg.tag == 'E') {
            int status = 0;
            wait_blocking(child, status);
            why = fmt::format("exec '{}' failed: {}", cmd.binary, strerror(msg.value));
            return spawn_error_from_errno(msg.value);
        }
        pid = child;
        return SpawnError::None;
    }

    SpawnError ProcessSupervisor::launch_disassociated(const protocol::SpawnCommand &cmd, pid_t &pid,
                                                       std::string &why) {
        std::vector<char*> argv = build_argv(cmd.binary, cmd.args);

        int pipefd[2];
        if (pipe2(pipefd, O_CLOEXEC) != 0) {
            why = std::string("pipe failed: ") + strerror(errno);
            return SpawnError::IoFailure;
        }

        pid_t mid = fork();
        if (mid < 0) {
            why = std::string("fork failed: ") + strerror(errno);
            close(pipefd[0]);
            close(pipefd[1]);
            return SpawnError::IoFailure;
        }
        if (mid == 0) {
            close(pipefd[0]);
            setsid();
            pid_t player = fork();
            if (player < 0) {
                write_status(pipefd[1], 'E', errno);
                _exit(1);
            }
            if (player > 0) {
                write_status(pipefd[1], 'P', player);
                _exit(0);
            }
            redirect_stdio_to_null();
            execvp(cmd.binary.c_str(), argv.data());
            write_status(pipefd[1], 'E', errno);
            _exit(127);
        }

        close(pipefd[1]);
        pid_t player = -1;
        int exec_errno = 0;
        for (;;) {
            StatusMsg msg{0, 0};
            ssize_t n = ::read(pipefd[0], &msg, sizeof(msg));
            if (n < 0 && errno == EINTR) continue;
            if (n != (ssize_t)sizeof(msg)) break; // EOF: everyone closed their end
            if (msg.tag == 'P') player = msg.value;
            if (msg.tag == 'E') exec_errno = msg.value;
        }
        close(pipefd[0]);

        int status = 0;
        wait_blocking(mid, status);

        if (exec_errno != 0) {
            why = fmt::format("exec '{}' failed: {}", cmd.binary, strerror(exec_errno));
            return spawn_error_from_errno(exec_errno);
        }
        if (player <= 0) {
            why = "intermediate process did not report the player pid";
            return SpawnError::IoFailure;
        }
        pid = player;
        return SpawnError::None;
    }

    SpawnError ProcessSupervisor::wait_foreground(pid_t pid, int &wait_status, std::string &why) {
        // the player owns the terminal now; keyboard signals are for it, not for us
        struct sigaction ignore{}, old_int{}, old_quit{};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &old_int);
        sigaction(SIGQUIT, &ignore, &old_quit);

        pid_t r = wait_blocking(pid, wait_status);
        int e = errno;

        sigaction(SIGINT, &old_int, nullptr);
        sigaction(SIGQUIT, &old_quit, nullptr);

        if (r < 0) {
            why = std::string("waitpid failed: ") + strerror(e);
            return SpawnError::IoFailure;
        }
        LOG_PROC_INFO("Foreground player pid={} {}", (int)pid, describe_status(wait_status));
        return SpawnError::None;
    }

    ProcessState ProcessSupervisor::check(pid_t pid, int &wait_status) {
        if (pid <= 0) return ProcessState::Gone;
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == 0) return ProcessState::Running;
        if (r == pid) {
            wait_status = status;
            unsupervised_.erase(std::remove(unsupervised_.begin(), unsupervised_.end(), pid), unsupervised_.end());
            LOG_PROC_DEBUG("Player pid={} {}", (int)pid, describe_status(status));
            return ProcessState::Exited;
        }
        if (r < 0 && errno == ECHILD) {
            // not our child (disassociated or already reaped): existence check only
            if (kill(pid, 0) == 0 || errno == EPERM) return ProcessState::Running;
        }
        return ProcessState::Gone;
    }

    void ProcessSupervisor::terminate(pid_t pid) {
        if (pid <= 0) return;
        if (kill(pid, SIGTERM) != 0) {
            if (errno != ESRCH) LOG_PROC_WARN("kill({}) failed: {}", (int)pid, strerror(errno));
            return;
        }
        LOG_PROC_INFO("Sent SIGTERM to player pid={}", (int)pid);
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == 0) {
            // still shutting down; collected by a later reap()
            if (std::find(unsupervised_.begin(), unsupervised_.end(), pid) == unsupervised_.end())
                unsupervised_.push_back(pid);
        }
    }

    void ProcessSupervisor::reap() {
        auto it = unsupervised_.begin();
        while (it != unsupervised_.end()) {
            int status = 0;
            pid_t r = waitpid(*it, &status, WNOHANG);
            if (r == 0) {
                ++it;
                continue;
            }
            if (r == *it) LOG_PROC_DEBUG("Reaped player pid={} {}", (int)*it, describe_status(status));
            it = unsupervised_.erase(it);
        }
    }

    SpawnConfirmTask::SpawnConfirmTask(task::Clock &clock, Supervisor &supervisor, pid_t pid,
                                       std::chrono::milliseconds window, std::chrono::milliseconds poll_interval)
            : Task(clock),
              supervisor_(supervisor),
              pid_(pid),
              window_(window),
              poll_interval_(poll_interval),
              started_(false),
              error_(SpawnError::None),
              exit_code_(0) {}

    Poll SpawnConfirmTask::step() {
        const task::TimePoint t = now();
        if (!started_) {
            started_ = true;
            deadline_ = t + window_;
        }

        int status = 0;
        switch (supervisor_.check(pid_, status)) {
            case ProcessState::Exited:
                error_ = SpawnError::ImmediateExit;
                exit_code_ = exit_code_of(status);
                detail_ = describe_status(status);
                LOG_PROC_WARN("Player pid={} {} right after start", (int)pid_, detail_);
                return Poll::Ready;
            case ProcessState::Gone:
                error_ = SpawnError::ImmediateExit;
                exit_code_ = -1;
                detail_ = "process vanished right after start";
                LOG_PROC_WARN("Player pid={} vanished right after start", (int)pid_);
                return Poll::Ready;
            case ProcessState::Running:
                break;
        }
        if (t >= deadline_) {
            LOG_PROC_DEBUG("Player pid={} confirmed running", (int)pid_);
            return Poll::Ready;
        }
        sleep_until(std::min(t + poll_interval_, deadline_));
        return Poll::Pending;
    }

} // namespace iptv::process
