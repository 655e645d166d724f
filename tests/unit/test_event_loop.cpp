#include <gtest/gtest.h>

#include "ipc/event_loop.hpp"

#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace mcpmux::ipc;
using namespace std::chrono_literals;

namespace
{

struct Pipe
{
    int fds[2] = {-1, -1};
    Pipe() { EXPECT_EQ(::pipe2(fds, O_NONBLOCK | O_CLOEXEC), 0); }
    ~Pipe()
    {
        for (int fd : fds)
            if (fd >= 0)
                ::close(fd);
    }
    int  rd() const { return fds[0]; }
    int  wr() const { return fds[1]; }
    void put(const char* s) { ASSERT_GT(::write(wr(), s, std::strlen(s)), 0); }
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Timers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(EventLoop, OneShotTimerFiresOnce)
{
    EventLoop loop;
    int       fired = 0;
    auto      id    = loop.add_timer(5ms, [&]() { ++fired; });
    EXPECT_TRUE(loop.has_timer(id));

    loop.run_for(50ms);
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(loop.has_timer(id));
}

TEST(EventLoop, RepeatingTimerFiresUntilCancelled)
{
    EventLoop loop;
    int       fired = 0;
    EventLoop::TimerId id = 0;
    id = loop.add_timer(
        2ms,
        [&]()
        {
            if (++fired == 3)
                loop.cancel_timer(id);
        },
        true);

    EXPECT_TRUE(loop.run_until([&]() { return fired >= 3; }, 1000ms));
    loop.run_for(20ms);
    EXPECT_EQ(fired, 3);
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST(EventLoop, TimersFireInDeadlineOrder)
{
    EventLoop        loop;
    std::vector<int> order;
    loop.add_timer(20ms, [&]() { order.push_back(2); });
    loop.add_timer(1ms, [&]() { order.push_back(1); });
    loop.add_timer(40ms, [&]() { order.push_back(3); });

    loop.run_until([&]() { return order.size() == 3; }, 1000ms);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoop, TimerCancelledByEarlierTimerDoesNotFire)
{
    EventLoop loop;
    bool      late_fired = false;
    auto      late       = loop.add_timer(1ms, [&]() { late_fired = true; });
    loop.add_timer(0ms, [&]() { loop.cancel_timer(late); });

    std::this_thread::sleep_for(5ms);
    loop.run_for(20ms);
    EXPECT_FALSE(late_fired);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Watchers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(EventLoop, ReadableWatcher)
{
    EventLoop loop;
    Pipe      p;
    std::string got;

    loop.add(p.rd(),
             EventLoop::EVENT_READABLE,
             [&](uint32_t events)
             {
                 EXPECT_TRUE(events & EventLoop::EVENT_READABLE);
                 char    buf[16];
                 ssize_t n = ::read(p.rd(), buf, sizeof(buf));
                 if (n > 0)
                     got.append(buf, static_cast<size_t>(n));
             });

    p.put("hi");
    EXPECT_TRUE(loop.run_until([&]() { return got == "hi"; }, 1000ms));
}

TEST(EventLoop, RemovedWatcherIsSilent)
{
    EventLoop loop;
    Pipe      p;
    int       calls = 0;
    auto      id    = loop.add(p.rd(), EventLoop::EVENT_READABLE, [&](uint32_t) { ++calls; });
    loop.remove(id);
    EXPECT_EQ(loop.watcher_count(), 0u);

    p.put("x");
    loop.run_for(20ms);
    EXPECT_EQ(calls, 0);
}

TEST(EventLoop, WatcherRemovedByEarlierCallbackInSamePass)
{
    EventLoop loop;
    Pipe      a;
    Pipe      b;
    int       b_calls = 0;

    EventLoop::WatchId b_id = 0;
    loop.add(a.rd(),
             EventLoop::EVENT_READABLE,
             [&](uint32_t)
             {
                 char c;
                 (void)::read(a.rd(), &c, 1);
                 loop.remove(b_id);
             });
    b_id = loop.add(b.rd(), EventLoop::EVENT_READABLE, [&](uint32_t) { ++b_calls; });

    a.put("1");
    b.put("1");
    loop.run_for(30ms);
    EXPECT_EQ(b_calls, 0);
}

TEST(EventLoop, WatcherCanRemoveItself)
{
    EventLoop          loop;
    Pipe               p;
    int                calls = 0;
    EventLoop::WatchId id    = 0;
    id = loop.add(p.rd(),
                  EventLoop::EVENT_READABLE,
                  [&](uint32_t)
                  {
                      ++calls;
                      loop.remove(id);
                  });
    p.put("x");
    loop.run_for(30ms);
    EXPECT_EQ(calls, 1);
}

TEST(EventLoop, WritableAfterUpdate)
{
    EventLoop loop;
    Pipe      p;
    int       writable = 0;
    auto      id       = loop.add(p.wr(), EventLoop::EVENT_NONE, [&](uint32_t events)
                       {
                           if (events & EventLoop::EVENT_WRITABLE)
                               ++writable;
                       });
    loop.run_for(10ms);
    EXPECT_EQ(writable, 0);

    loop.update(id, EventLoop::EVENT_WRITABLE);
    EXPECT_TRUE(loop.run_until([&]() { return writable > 0; }, 1000ms));
}

TEST(EventLoop, HangupReportedAsError)
{
    EventLoop loop;
    Pipe      p;
    uint32_t  seen = 0;
    loop.add(p.rd(), EventLoop::EVENT_READABLE, [&](uint32_t events) { seen |= events; });

    ::close(p.fds[1]);
    p.fds[1] = -1;
    EXPECT_TRUE(loop.run_until([&]() { return (seen & EventLoop::EVENT_ERROR) != 0; }, 1000ms));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Deferred tasks and stop
// ═══════════════════════════════════════════════════════════════════════════════

TEST(EventLoop, DeferredRunsAfterCurrentCallback)
{
    EventLoop        loop;
    std::vector<int> order;
    loop.add_timer(0ms,
                   [&]()
                   {
                       loop.defer([&]() { order.push_back(2); });
                       order.push_back(1);
                   });
    loop.run_until([&]() { return order.size() == 2; }, 1000ms);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventLoop, StopEndsRun)
{
    EventLoop loop;
    loop.add_timer(5ms, [&]() { loop.stop(); });

    auto t0 = std::chrono::steady_clock::now();
    loop.run();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1000ms);
    EXPECT_TRUE(loop.stop_requested());

    // The next run clears the request.
    loop.run_for(1ms);
    EXPECT_FALSE(loop.stop_requested());
}

TEST(EventLoop, RunUntilTimesOut)
{
    EventLoop loop;
    auto      t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(loop.run_until([]() { return false; }, 30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 30ms);
}

TEST(EventLoop, RunUntilReturnsImmediatelyWhenTrue)
{
    EventLoop loop;
    loop.add_timer(500ms, []() {});
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(loop.run_until([]() { return true; }, 1000ms));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 100ms);
}
