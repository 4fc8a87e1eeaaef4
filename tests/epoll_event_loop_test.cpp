// SPDX-License-Identifier: MIT

// tests/epoll_event_loop_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"

using namespace chanserv;
using namespace std::chrono_literals;

TEST(EpollEventLoopTest, DeferredWorkKeepsOrder) {
    EpollEventLoop loop;

    std::vector<int> seen;
    for (int i = 1; i <= 4; ++i) {
        loop.Defer([&seen, i] { seen.push_back(i); });
    }
    loop.Poll(0);

    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 4}));
}

TEST(EpollEventLoopTest, CallbacksSeeLoopThread) {
    EpollEventLoop loop;
    EXPECT_FALSE(loop.IsInEventLoopThread());

    bool inside = false;
    loop.Defer([&] { inside = loop.IsInEventLoopThread(); });
    loop.Poll(0);

    EXPECT_TRUE(inside);
}

TEST(EpollEventLoopTest, DeferBeforeRunIsNotLost) {
    EpollEventLoop loop;

    bool ran = false;
    loop.Defer([&] {
        ran = true;
        loop.Stop();
    });
    loop.Run();

    EXPECT_TRUE(ran);
}

TEST(EpollEventLoopTest, TimersFireByDeadlineNotByScheduleOrder) {
    EpollEventLoop loop;

    std::vector<char> fired;
    loop.Schedule(60ms, [&] {
        fired.push_back('c');
        loop.Stop();
    });
    loop.Schedule(30ms, [&] { fired.push_back('b'); });
    loop.Schedule(5ms, [&] { fired.push_back('a'); });
    loop.Run();

    EXPECT_EQ(fired, (std::vector<char>{'a', 'b', 'c'}));
}

TEST(EpollEventLoopTest, EqualDeadlinesFireInScheduleOrder) {
    EpollEventLoop loop;

    std::vector<int> fired;
    for (int i = 0; i < 3; ++i) {
        loop.Schedule(0ms, [&fired, i] { fired.push_back(i); });
    }
    loop.Schedule(20ms, [&] { loop.Stop(); });
    loop.Run();

    EXPECT_EQ(fired, (std::vector<int>{0, 1, 2}));
}

TEST(EpollEventLoopTest, TimerFiresOnce) {
    EpollEventLoop loop;

    int fired = 0;
    loop.Schedule(5ms, [&] { ++fired; });
    loop.Schedule(50ms, [&] { loop.Stop(); });
    loop.Run();

    EXPECT_EQ(fired, 1);
}

TEST(EpollEventLoopTest, TimerCanScheduleAnother) {
    EpollEventLoop loop;

    int hops = 0;
    std::function<void()> hop = [&] {
        if (++hops == 3) {
            loop.Stop();
        } else {
            loop.Schedule(5ms, hop);
        }
    };
    loop.Schedule(5ms, hop);
    loop.Run();

    EXPECT_EQ(hops, 3);
}

TEST(EpollEventLoopTest, EarlierTimerFromOtherThreadPreemptsPending) {
    EpollEventLoop loop;
    std::atomic<bool> early{false};
    std::atomic<bool> late{false};

    loop.Schedule(10s, [&] { late = true; });
    std::jthread runner([&loop] { loop.Run(); });
    std::this_thread::sleep_for(10ms);
    loop.Schedule(5ms, [&] { early = true; });

    for (int i = 0; i < 200 && !early.load(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    loop.Stop();
    runner.join();

    EXPECT_TRUE(early.load());
    EXPECT_FALSE(late.load());
}

TEST(EpollEventLoopTest, StopBeforeRunReturnsImmediately) {
    EpollEventLoop loop;
    bool ran = false;
    loop.Defer([&] { ran = true; });

    loop.Stop();
    loop.Run();

    EXPECT_FALSE(ran);
}
