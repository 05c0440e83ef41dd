/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_TASK_HPP
#define IPTV_TASK_HPP

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include <poll.h>

namespace iptv::task {

    using TimePoint = std::chrono::steady_clock::time_point;

/**
 * @brief Time source and idle wait used by the cooperative scheduler.
 *
 * Production code uses SystemClock; tests substitute a manual clock that advances virtual
 * time inside wait_until() instead of sleeping.
 */
    class Clock {
    public:
        virtual ~Clock() = default;

        virtual TimePoint now() const = 0;

        /// Block until `deadline` or until one of `fds` reports an event, whichever comes first.
        virtual void wait_until(std::vector<pollfd> &fds, TimePoint deadline) = 0;
    };

    class SystemClock : public Clock {
    public:
        TimePoint now() const override { return std::chrono::steady_clock::now(); }
        void wait_until(std::vector<pollfd> &fds, TimePoint deadline) override;
    };

    enum class Poll {
        Pending,
        Ready
    };

/**
 * @brief A resumable state machine. poll() never blocks the calling thread.
 *
 * Each step() that returns Pending declares when it next wants to run (sleep_until) and,
 * optionally, one descriptor whose readiness should wake the loop early (wait_on).
 * Tasks compose by polling child tasks and forwarding their wake-up requests (follow).
 */
    class Task {
    public:
        explicit Task(Clock &clock);
        virtual ~Task();

        Poll poll();

        bool done() const { return done_; }
        TimePoint wake_at() const { return wake_at_; }
        int wait_fd() const { return wait_fd_; }
        short wait_events() const { return wait_events_; }

        virtual const char *name() const = 0;

    protected:
        virtual Poll step() = 0;

        void sleep_until(TimePoint tp) { if (tp < wake_at_) wake_at_ = tp; }
        void wait_on(int fd, short events) { wait_fd_ = fd; wait_events_ = events; }
        void follow(const Task &child);

        TimePoint now() const { return clock_.now(); }

        Clock &clock_;

    private:
        bool done_;
        TimePoint wake_at_;
        int wait_fd_;
        short wait_events_;

        Task(const Task&) = delete;
        Task& operator=(const Task&) = delete;
    };

/**
 * @brief Single-threaded driver for tasks.
 *
 * tick() polls every unfinished task once; wait() sleeps until the earliest wake-up or fd
 * readiness. A UI main loop interleaves tick() with its own input handling and uses
 * next_wake()/wait_fds() to bound its own poll(); run_until_done() is the blocking helper
 * for non-interactive callers.
 */
    class Scheduler {
    public:
        explicit Scheduler(Clock &clock) : clock_(clock) {}

        void submit(std::shared_ptr<Task> task);

        /// Poll all pending tasks once. Returns the number still pending.
        size_t tick();

        bool idle() const { return tasks_.empty(); }

        TimePoint next_wake() const;

        /// Descriptors pending tasks are waiting on (for the caller's poll set).
        std::vector<pollfd> wait_fds() const;

        /// Sleep until something may have changed.
        void wait();

        /// Drive until `task` is done (other submitted tasks progress too).
        void run_until_done(const std::shared_ptr<Task> &task);

        Clock &clock() { return clock_; }

    private:
        Clock &clock_;
        std::vector<std::shared_ptr<Task>> tasks_;
    };

} // namespace iptv::task

#endif // IPTV_TASK_HPP
