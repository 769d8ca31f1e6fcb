/**
 * @file test_execution_context.cpp
 * @brief Unit tests for the threaded and cooperative execution contexts
 */

#include <gtest/gtest.h>

#include <kcenon/blob/core/execution_context.h>

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace kcenon::blob::test {

using namespace std::chrono_literals;

TEST(ThreadPoolExecutionTest, DispatchedJobsRunOnWorkers) {
    auto ctx = thread_pool_execution::create(2);
    ASSERT_EQ(ctx->model(), execution_model::threaded);

    std::mutex mutex;
    int done = 0;
    auto caller = std::this_thread::get_id();
    std::atomic<bool> ran_elsewhere{true};

    for (int i = 0; i < 4; ++i) {
        ctx->dispatch(
            [&] {
                if (std::this_thread::get_id() == caller) ran_elsewhere = false;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    ++done;
                }
                ctx->notify();
            },
            "test");
    }

    auto waited = ctx->wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return done == 4;
    });
    ASSERT_TRUE(waited);
    EXPECT_TRUE(ran_elsewhere);
}

TEST(ThreadPoolExecutionTest, DeadlineGivesTimeout) {
    auto ctx = thread_pool_execution::create(1);
    auto waited = ctx->wait_until([] { return false; },
                                  std::chrono::steady_clock::now() + 20ms);
    ASSERT_FALSE(waited);
    EXPECT_EQ(waited.error().code, error_code::transfer_timeout);
}

TEST(ThreadPoolExecutionTest, DeferRunsAfterDelay) {
    auto ctx = thread_pool_execution::create(1);
    auto start = std::chrono::steady_clock::now();
    bool ran = false;
    ctx->defer(15ms, [&] { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

TEST(IoContextExecutionTest, JobsRunOnWaitingThread) {
    io_context_execution ctx;
    ASSERT_EQ(ctx.model(), execution_model::cooperative);

    int done = 0;
    auto caller = std::this_thread::get_id();
    bool same_thread = true;
    for (int i = 0; i < 3; ++i) {
        ctx.dispatch(
            [&] {
                if (std::this_thread::get_id() != caller) same_thread = false;
                ++done;
            },
            "test");
    }
    EXPECT_EQ(done, 0);

    ASSERT_TRUE(ctx.wait_until([&] { return done == 3; }));
    EXPECT_TRUE(same_thread);
}

TEST(IoContextExecutionTest, DeferDoesNotBlock) {
    io_context_execution ctx;
    bool ran = false;
    ctx.defer(10ms, [&] { ran = true; });
    EXPECT_FALSE(ran);
    ASSERT_TRUE(ctx.wait_until([&] { return ran; }));
}

TEST(IoContextExecutionTest, DeadlineGivesTimeout) {
    io_context_execution ctx;
    bool ran = false;
    ctx.defer(500ms, [&] { ran = true; });
    auto waited = ctx.wait_until([&] { return ran; }, std::chrono::steady_clock::now() + 20ms);
    ASSERT_FALSE(waited);
    EXPECT_EQ(waited.error().code, error_code::transfer_timeout);
}

TEST(IoContextExecutionTest, WaitWithoutWorkFails) {
    io_context_execution ctx;
    auto waited = ctx.wait_until([] { return false; });
    ASSERT_FALSE(waited);
    EXPECT_EQ(waited.error().code, error_code::internal_error);
}

TEST(IoContextExecutionTest, BorrowsCallerContext) {
    boost::asio::io_context io;
    io_context_execution ctx(io);
    EXPECT_EQ(&ctx.io_context(), &io);

    int done = 0;
    ctx.dispatch([&] { ++done; }, "test");
    io.run();
    EXPECT_EQ(done, 1);
}

}  // namespace kcenon::blob::test
