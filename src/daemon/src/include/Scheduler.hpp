/*
 * Valheim Server Manager — Scheduler (header)
 * Cooperative single-threaded task runner driving every timer in the daemon.
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace vsm {

/*
 * Scheduler: delayed and periodic tasks plus socket readiness on one thread.
 * - Periodic tasks are re-armed only after the current tick returned, so two
 *   ticks of one task never overlap.
 * - cancel() is idempotent; a task cancelled from inside its own tick is
 *   not re-armed.
 * - Watched descriptors are polled without waiting on every runDue() and
 *   with the idle wait inside run(), so I/O never holds up the timers.
 * - The clock is injectable; tests drive time by hand and call runDue().
 * - Only requestStop() may be called from another thread.
 */
class Scheduler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::milliseconds;
    using TaskId    = std::uint64_t;
    using Task      = std::function<void()>;
    using NowFn     = std::function<TimePoint()>;
    using WatchId   = std::uint64_t;
    using IoHandler = std::function<void(short revents)>;

    static constexpr TaskId  kInvalidTask  = 0;
    static constexpr WatchId kInvalidWatch = 0;

    Scheduler();
    explicit Scheduler(NowFn now);

    TaskId runAfter(Duration delay, Task fn);
    TaskId runEvery(Duration interval, Task fn);

    /* Returns true if the task was still pending. */
    bool cancel(TaskId id);
    bool pending(TaskId id) const;
    size_t size() const noexcept { return tasks_.size(); }

    /* Run every task due at the current clock reading, then the handlers of
     * ready descriptors; returns the count. */
    size_t runDue();

    /* Level-triggered readiness watch (POLLIN/POLLOUT). Handlers may add or
     * remove watches, their own included. */
    WatchId watchFd(int fd, short events, IoHandler fn);
    void setWatchEvents(WatchId id, short events);
    bool unwatchFd(WatchId id);
    size_t watchCount() const noexcept { return watches_.size(); }

    /* Wait at most timeout for a watched descriptor, then run the handlers
     * of the ready ones; returns the count. Sleeps when nothing is watched. */
    size_t pollIo(Duration timeout);

    std::optional<TimePoint> nextDue() const;
    TimePoint now() const { return now_(); }

    /* Loop until requestStop(): runDue, then wait for I/O until the next due
     * task (clamped to [1, 50] ms so stop requests stay responsive). */
    void run();

    /* Drive the loop until pred() holds or timeout elapses; returns pred(). */
    bool runUntil(const std::function<bool()>& pred, Duration timeout);

    void requestStop() { stop_.store(true, std::memory_order_relaxed); }
    void resetStop() { stop_.store(false, std::memory_order_relaxed); }
    bool stopRequested() const { return stop_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        TimePoint due;
        Duration  interval{0};
        bool      periodic{false};
        std::uint64_t seq{0};
        Task      fn;
    };

    struct Watch {
        int       fd{-1};
        short     events{0};
        IoHandler fn;
    };

    TaskId add_(Duration delay, Duration interval, bool periodic, Task fn);
    void sleepUntilNext_();

    NowFn now_;
    std::map<TaskId, Entry> tasks_;
    std::map<WatchId, Watch> watches_;
    TaskId nextId_{1};
    WatchId nextWatch_{1};
    std::uint64_t seq_{0};
    std::atomic<bool> stop_{false};
};

} // namespace vsm
