// SPDX-License-Identifier: MIT

// tests/service_loop_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "lib/stream/service_loop.hpp"

using namespace chanserv;
using namespace std::chrono_literals;

namespace {

// Collects reported errors and lets the test wait for them
class ErrorSink {
public:
    ErrorHandler Handler() {
        return [this](const Error& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            errors_.push_back(e);
            threads_.push_back(std::this_thread::get_id());
            cv_.notify_all();
        };
    }

    bool WaitFor(size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return errors_.size() >= n; });
    }

    std::vector<Error> errors() {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    std::vector<std::thread::id> threads() {
        std::lock_guard<std::mutex> lock(mutex_);
        return threads_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Error> errors_;
    std::vector<std::thread::id> threads_;
};

}  // namespace

TEST(ServiceLoopTest, ReportRunsHookOnLoopThread) {
    ErrorSink sink;
    ServiceLoop loop(sink.Handler());

    loop.Report(Error{ErrorCode::ConnectionReset, "reset"});
    ASSERT_TRUE(sink.WaitFor(1));

    auto errors = sink.errors();
    EXPECT_EQ(errors[0].code, ErrorCode::ConnectionReset);
    EXPECT_NE(sink.threads()[0], std::this_thread::get_id());
}

TEST(ServiceLoopTest, ReportsFromManyThreads) {
    ErrorSink sink;
    ServiceLoop loop(sink.Handler());

    std::vector<std::jthread> reporters;
    for (int i = 0; i < 8; ++i) {
        reporters.emplace_back([&loop] {
            loop.Report(Error{ErrorCode::ParseError, "bad record"});
        });
    }
    reporters.clear();

    ASSERT_TRUE(sink.WaitFor(8));
    EXPECT_EQ(sink.errors().size(), 8u);
}

TEST(ServiceLoopTest, ThrowingHookDoesNotStopLoop) {
    std::atomic<int> calls{0};
    ServiceLoop loop([&](const Error&) {
        if (++calls == 1) {
            throw std::runtime_error("hook failure");
        }
    });

    loop.Report(Error{ErrorCode::ParseError, "first"});
    loop.Report(Error{ErrorCode::ParseError, "second"});
    for (int i = 0; i < 200 && calls.load() < 2; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(calls.load(), 2);
}

TEST(ServiceLoopTest, ReportWithoutHookOnlyLogs) {
    ServiceLoop loop;
    loop.Report(Error{ErrorCode::SourceTimeout, "not dialed"});
}

TEST(ServiceLoopTest, AfterFiresOnce) {
    ServiceLoop loop;
    std::atomic<int> fired{0};

    loop.After(10ms, [&] { ++fired; });
    for (int i = 0; i < 200 && fired.load() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(fired.load(), 1);
}

TEST(ServiceLoopTest, StopDropsPendingTimers) {
    std::atomic<bool> fired{false};
    {
        ServiceLoop loop;
        loop.After(1000ms, [&] { fired = true; });
        loop.Stop();
    }
    EXPECT_FALSE(fired.load());
}
