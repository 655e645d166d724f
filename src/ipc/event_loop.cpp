#include "event_loop.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <utility>

#include <poll.h>

namespace mcpmux::ipc
{

namespace
{
constexpr std::chrono::milliseconds MAX_POLL_WAIT{1000};

short to_poll_events(uint32_t events)
{
    short out = 0;
    if (events & EventLoop::EVENT_READABLE)
        out |= POLLIN;
    if (events & EventLoop::EVENT_WRITABLE)
        out |= POLLOUT;
    return out;
}

uint32_t from_poll_events(short revents)
{
    uint32_t mask = EventLoop::EVENT_NONE;
    if (revents & POLLIN)
        mask |= EventLoop::EVENT_READABLE;
    if (revents & POLLOUT)
        mask |= EventLoop::EVENT_WRITABLE;
    if (revents & (POLLERR | POLLHUP | POLLNVAL))
        mask |= EventLoop::EVENT_ERROR;
    return mask;
}
}   // namespace

// ─── Watchers ────────────────────────────────────────────────────────────────

EventLoop::WatchId EventLoop::add(int fd, uint32_t events, IoCallback callback)
{
    WatchId id    = next_watch_id_++;
    watchers_[id] = Watcher{fd, events, std::move(callback)};
    return id;
}

void EventLoop::update(WatchId id, uint32_t events)
{
    auto it = watchers_.find(id);
    if (it != watchers_.end())
        it->second.events = events;
}

void EventLoop::remove(WatchId id)
{
    watchers_.erase(id);
}

// ─── Timers ──────────────────────────────────────────────────────────────────

EventLoop::TimerId EventLoop::add_timer(std::chrono::milliseconds delay, Task callback, bool repeat)
{
    TimerId id  = next_timer_id_++;
    timers_[id] = Timer{Clock::now() + delay, delay, repeat, std::move(callback)};
    return id;
}

void EventLoop::cancel_timer(TimerId id)
{
    timers_.erase(id);
}

void EventLoop::defer(Task task)
{
    deferred_.push_back(std::move(task));
}

// ─── Running ─────────────────────────────────────────────────────────────────

void EventLoop::run()
{
    stop_requested_ = false;
    while (!stop_requested_)
        run_once(MAX_POLL_WAIT);
}

void EventLoop::run_for(std::chrono::milliseconds duration)
{
    stop_requested_ = false;
    auto deadline   = Clock::now() + duration;
    while (!stop_requested_)
    {
        auto now = Clock::now();
        if (now >= deadline)
            break;
        run_once(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    }
}

bool EventLoop::run_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout)
{
    stop_requested_ = false;
    auto deadline   = Clock::now() + timeout;
    while (!pred() && !stop_requested_)
    {
        auto now = Clock::now();
        if (now >= deadline)
            break;
        // Short slices so the predicate is re-checked promptly.
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        run_once(std::min(remaining, std::chrono::milliseconds(10)));
    }
    return pred();
}

int EventLoop::compute_timeout_ms(std::chrono::milliseconds max_wait) const
{
    if (!deferred_.empty())
        return 0;

    auto wait = std::min(max_wait, MAX_POLL_WAIT);
    auto now  = Clock::now();
    for (const auto& [id, timer] : timers_)
    {
        if (timer.deadline <= now)
            return 0;
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(timer.deadline - now)
                     + std::chrono::milliseconds(1);
        wait = std::min(wait, until);
    }
    return static_cast<int>(std::max(wait, std::chrono::milliseconds(0)).count());
}

void EventLoop::run_once(std::chrono::milliseconds max_wait)
{
    std::vector<pollfd>  pfds;
    std::vector<WatchId> ids;
    pfds.reserve(watchers_.size());
    ids.reserve(watchers_.size());
    for (const auto& [id, w] : watchers_)
    {
        pfds.push_back(pollfd{w.fd, to_poll_events(w.events), 0});
        ids.push_back(id);
    }

    int ready = ::poll(pfds.data(), pfds.size(), compute_timeout_ms(max_wait));
    if (ready < 0 && errno != EINTR)
        throw std::system_error(errno, std::generic_category(), "poll failed");

    for (size_t i = 0; ready > 0 && i < pfds.size(); ++i)
    {
        if (pfds[i].revents == 0)
            continue;

        // Removed or replaced by an earlier callback in this pass.
        auto it = watchers_.find(ids[i]);
        if (it == watchers_.end() || it->second.fd != pfds[i].fd)
            continue;

        uint32_t mask = from_poll_events(pfds[i].revents);
        if (mask == EVENT_NONE)
            continue;

        IoCallback cb = it->second.callback;
        cb(mask);
    }

    fire_due_timers();
    run_deferred();
}

void EventLoop::fire_due_timers()
{
    auto now = Clock::now();

    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& [id, timer] : timers_)
    {
        if (timer.deadline <= now)
            due.emplace_back(timer.deadline, id);
    }
    std::sort(due.begin(), due.end());

    for (const auto& [deadline, id] : due)
    {
        auto it = timers_.find(id);
        if (it == timers_.end())
            continue;   // cancelled by an earlier timer

        Task cb = it->second.callback;
        if (it->second.repeat)
            it->second.deadline = now + it->second.interval;
        else
            timers_.erase(it);
        cb();
    }
}

void EventLoop::run_deferred()
{
    // Tasks queued while draining run on the next pass.
    std::vector<Task> tasks;
    tasks.swap(deferred_);
    for (auto& task : tasks)
        task();
}

}   // namespace mcpmux::ipc
