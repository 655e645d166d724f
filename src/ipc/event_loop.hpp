#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <vector>

namespace mcpmux::ipc
{

// ─── EventLoop ───────────────────────────────────────────────────────────────
// Single-threaded poll() reactor: fd watchers, one-shot and repeating timers,
// and deferred tasks. Not thread-safe; every callback runs on the thread that
// calls run*(). Watchers and timers may be added or removed from inside any
// callback, including their own.

class EventLoop
{
   public:
    using WatchId    = uint64_t;
    using TimerId    = uint64_t;
    using IoCallback = std::function<void(uint32_t events)>;
    using Task       = std::function<void()>;
    using Clock      = std::chrono::steady_clock;

    static constexpr uint32_t EVENT_NONE     = 0;
    static constexpr uint32_t EVENT_READABLE = 1u << 0;
    static constexpr uint32_t EVENT_WRITABLE = 1u << 1;
    static constexpr uint32_t EVENT_ERROR    = 1u << 2;   // POLLERR / POLLHUP / POLLNVAL

    EventLoop() = default;
    ~EventLoop() = default;

    EventLoop(const EventLoop&)            = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Watch `fd` for `events`. EVENT_ERROR is always reported.
    WatchId add(int fd, uint32_t events, IoCallback callback);
    void    update(WatchId id, uint32_t events);
    void    remove(WatchId id);

    TimerId add_timer(std::chrono::milliseconds delay, Task callback, bool repeat = false);
    void    cancel_timer(TimerId id);
    bool    has_timer(TimerId id) const { return timers_.count(id) != 0; }

    // Run `task` on the next loop iteration, after the current callback returns.
    void defer(Task task);

    // Run until stop().
    void run();

    // Run until `duration` elapses or stop() is called.
    void run_for(std::chrono::milliseconds duration);

    // Run until `pred` holds, `timeout` elapses, or stop() is called.
    // Returns the final value of pred().
    bool run_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout);

    // Make the innermost run*() return after the current callback.
    void stop() { stop_requested_ = true; }
    bool stop_requested() const { return stop_requested_; }

    size_t watcher_count() const { return watchers_.size(); }
    size_t timer_count() const { return timers_.size(); }

   private:
    struct Watcher
    {
        int        fd     = -1;
        uint32_t   events = EVENT_NONE;
        IoCallback callback;
    };

    struct Timer
    {
        Clock::time_point         deadline;
        std::chrono::milliseconds interval{0};
        bool                      repeat = false;
        Task                      callback;
    };

    // One poll() pass, waiting at most `max_wait`. Dispatches ready fds,
    // due timers and deferred tasks.
    void run_once(std::chrono::milliseconds max_wait);
    void fire_due_timers();
    void run_deferred();
    int  compute_timeout_ms(std::chrono::milliseconds max_wait) const;

    std::map<WatchId, Watcher>         watchers_;
    std::unordered_map<TimerId, Timer> timers_;
    std::vector<Task>                  deferred_;

    WatchId next_watch_id_ = 1;
    TimerId next_timer_id_ = 1;
    bool    stop_requested_ = false;
};

}   // namespace mcpmux::ipc
