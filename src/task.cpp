/*
* @license
* (C) zachbabanov
*
*/

#include <task.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

using namespace iptv::log;

namespace iptv::task {

    void SystemClock::wait_until(std::vector<pollfd> &fds, TimePoint deadline) {
        using namespace std::chrono;
        auto remaining = duration_cast<milliseconds>(deadline - now());
        // round up so we do not wake a hair before the deadline and spin
        int timeout_ms = remaining.count() <= 0 ? 0 : static_cast<int>(std::min<long long>(remaining.count() + 1, 60000));
        int r = ::poll(fds.empty() ? nullptr : fds.data(), fds.size(), timeout_ms);
        if (r < 0 && errno != EINTR) {
            LOG_GEN_WARN("poll failed: {}", strerror(errno));
        }
    }

    Task::Task(Clock &clock)
            : clock_(clock), done_(false), wake_at_(TimePoint::max()), wait_fd_(-1), wait_events_(0) {}

    Task::~Task() = default;

    Poll Task::poll() {
        if (done_) return Poll::Ready;
        wake_at_ = TimePoint::max();
        wait_fd_ = -1;
        wait_events_ = 0;
        Poll r = step();
        if (r == Poll::Ready) {
            done_ = true;
        } else if (wake_at_ == TimePoint::max() && wait_fd_ < 0) {
            // pending without a wake-up request: run again on the next tick
            wake_at_ = now();
        }
        return r;
    }

    void Task::follow(const Task &child) {
        sleep_until(child.wake_at());
        if (child.wait_fd() >= 0) wait_on(child.wait_fd(), child.wait_events());
    }

    void Scheduler::submit(std::shared_ptr<Task> task) {
        if (!task || task->done()) return;
        if (std::find(tasks_.begin(), tasks_.end(), task) != tasks_.end()) return;
        LOG_GEN_TRACE("Scheduler: task '{}' submitted", task->name());
        tasks_.push_back(std::move(task));
    }

    size_t Scheduler::tick() {
        // tasks may submit new tasks while being polled; iterate over a snapshot
        std::vector<std::shared_ptr<Task>> snapshot = tasks_;
        for (auto &t : snapshot) {
            if (t->poll() == Poll::Ready) {
                LOG_GEN_TRACE("Scheduler: task '{}' finished", t->name());
            }
        }
        tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                    [](const std::shared_ptr<Task> &t) { return t->done(); }),
                     tasks_.end());
        return tasks_.size();
    }

    TimePoint Scheduler::next_wake() const {
        TimePoint earliest = TimePoint::max();
        for (auto &t : tasks_) earliest = std::min(earliest, t->wake_at());
        return earliest;
    }

    std::vector<pollfd> Scheduler::wait_fds() const {
        std::vector<pollfd> fds;
        for (auto &t : tasks_) {
            if (t->wait_fd() < 0) continue;
            pollfd p{};
            p.fd = t->wait_fd();
            p.events = t->wait_events();
            fds.push_back(p);
        }
        return fds;
    }

    void Scheduler::wait() {
        if (tasks_.empty()) return;
        std::vector<pollfd> fds = wait_fds();
        clock_.wait_until(fds, next_wake());
    }

    void Scheduler::run_until_done(const std::shared_ptr<Task> &task) {
        submit(task);
        while (!task->done()) {
            tick();
            if (task->done()) break;
            wait();
        }
    }

} // namespace iptv::task
