/*
 * Valheim Server Manager — Scheduler (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/Scheduler.hpp"
#include "include/Log.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

#include <poll.h>

namespace vsm {

constexpr int kSleepMinMs = 1;   // avoid 0ms busy spin
constexpr int kSleepMaxMs = 50;  // keep responsiveness for RPC & stop requests

Scheduler::Scheduler()
: now_([] { return Clock::now(); }) {}

Scheduler::Scheduler(NowFn now)
: now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

Scheduler::TaskId Scheduler::runAfter(Duration delay, Task fn) {
    return add_(delay, Duration(0), false, std::move(fn));
}

Scheduler::TaskId Scheduler::runEvery(Duration interval, Task fn) {
    if (interval < Duration(1)) interval = Duration(1);
    return add_(interval, interval, true, std::move(fn));
}

Scheduler::TaskId Scheduler::add_(Duration delay, Duration interval, bool periodic, Task fn) {
    if (delay < Duration(0)) delay = Duration(0);
    const TaskId id = nextId_++;
    Entry e;
    e.due      = now_() + delay;
    e.interval = interval;
    e.periodic = periodic;
    e.seq      = ++seq_;
    e.fn       = std::move(fn);
    tasks_.emplace(id, std::move(e));
    return id;
}

bool Scheduler::cancel(TaskId id) {
    if (id == kInvalidTask) return false;
    return tasks_.erase(id) > 0;
}

bool Scheduler::pending(TaskId id) const {
    return tasks_.find(id) != tasks_.end();
}

Scheduler::WatchId Scheduler::watchFd(int fd, short events, IoHandler fn) {
    const WatchId id = nextWatch_++;
    watches_.emplace(id, Watch{fd, events, std::move(fn)});
    return id;
}

void Scheduler::setWatchEvents(WatchId id, short events) {
    auto it = watches_.find(id);
    if (it != watches_.end()) it->second.events = events;
}

bool Scheduler::unwatchFd(WatchId id) {
    if (id == kInvalidWatch) return false;
    return watches_.erase(id) > 0;
}

size_t Scheduler::pollIo(Duration timeout) {
    if (timeout < Duration(0)) timeout = Duration(0);
    if (watches_.empty()) {
        if (timeout > Duration(0)) std::this_thread::sleep_for(timeout);
        return 0;
    }

    std::vector<pollfd> fds;
    std::vector<WatchId> ids;
    fds.reserve(watches_.size());
    ids.reserve(watches_.size());
    for (const auto& kv : watches_) {
        fds.push_back(pollfd{kv.second.fd, kv.second.events, 0});
        ids.push_back(kv.first);
    }

    const int r = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), static_cast<int>(timeout.count()));
    if (r < 0) {
        if (errno != EINTR) LOG_WARN("scheduler: poll() failed: %s", std::strerror(errno));
        return 0;
    }
    if (r == 0) return 0;

    size_t ran = 0;
    for (size_t i = 0; i < fds.size(); ++i) {
        const short revents = fds[i].revents;
        if (revents == 0) continue;
        auto it = watches_.find(ids[i]);
        if (it == watches_.end()) continue; // removed by an earlier handler
        if (revents & POLLNVAL) {
            LOG_WARN("scheduler: fd %d is not open, dropping watch %llu",
                     fds[i].fd, static_cast<unsigned long long>(ids[i]));
            watches_.erase(it);
            continue;
        }
        IoHandler fn = it->second.fn;
        try {
            fn(revents);
        } catch (const std::exception& ex) {
            LOG_ERROR("scheduler: io handler for fd %d threw: %s", fds[i].fd, ex.what());
        }
        ++ran;
    }
    return ran;
}

std::optional<Scheduler::TimePoint> Scheduler::nextDue() const {
    std::optional<TimePoint> best;
    for (const auto& kv : tasks_) {
        if (!best || kv.second.due < *best) best = kv.second.due;
    }
    return best;
}

size_t Scheduler::runDue() {
    const TimePoint now = now_();
    size_t ran = 0;
    // Tasks armed during this pass (seq above the mark) wait for the next pass.
    const std::uint64_t seqMark = seq_;

    for (;;) {
        TaskId pick = kInvalidTask;
        const Entry* best = nullptr;
        for (const auto& kv : tasks_) {
            const Entry& e = kv.second;
            if (e.due > now || e.seq > seqMark) continue;
            if (!best || e.due < best->due || (e.due == best->due && e.seq < best->seq)) {
                best = &e;
                pick = kv.first;
            }
        }
        if (pick == kInvalidTask) break;

        auto it = tasks_.find(pick);
        Task fn = it->second.fn;
        if (!it->second.periodic) {
            tasks_.erase(it);
        } else {
            // Park the entry beyond this pass until the tick returns.
            it->second.seq = ++seq_;
        }

        try {
            fn();
        } catch (const std::exception& ex) {
            LOG_ERROR("scheduler: task %llu threw: %s",
                      static_cast<unsigned long long>(pick), ex.what());
        }
        ++ran;

        auto again = tasks_.find(pick);
        if (again != tasks_.end() && again->second.periodic) {
            Entry& e = again->second;
            e.due += e.interval;
            const TimePoint after = now_();
            if (e.due <= after) e.due = after + e.interval; // skip missed ticks
        }
    }
    return ran + pollIo(Duration(0));
}

void Scheduler::sleepUntilNext_() {
    long sleepMs = kSleepMaxMs;
    if (auto due = nextDue()) {
        const auto now = now_();
        sleepMs = (*due > now)
            ? static_cast<long>(std::chrono::duration_cast<Duration>(*due - now).count())
            : kSleepMinMs;
    }
    if (sleepMs < kSleepMinMs) sleepMs = kSleepMinMs;
    if (sleepMs > kSleepMaxMs) sleepMs = kSleepMaxMs;
    pollIo(Duration(sleepMs));
}

void Scheduler::run() {
    LOG_DEBUG("scheduler: run enter (%zu tasks)", tasks_.size());
    while (!stopRequested()) {
        runDue();
        if (stopRequested()) break;
        sleepUntilNext_();
    }
    LOG_DEBUG("scheduler: run exit");
}

bool Scheduler::runUntil(const std::function<bool()>& pred, Duration timeout) {
    const auto deadline = Clock::now() + timeout;
    for (;;) {
        runDue();
        if (pred()) return true;
        if (Clock::now() >= deadline) return pred();
        sleepUntilNext_();
    }
}

} // namespace vsm
