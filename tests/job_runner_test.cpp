#include <gtest/gtest.h>
#include "core/job_runner.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

TEST(JobRunnerTest, ReturnsResultThroughFuture)
{
    JobRunner runner;
    auto future = runner.submit<int>([](const CancellationToken &)
                                     { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(JobRunnerTest, JobsRunOneAtATimeInOrder)
{
    JobRunner runner;
    std::vector<int> order;
    std::mutex order_mutex;
    std::vector<std::future<bool>> futures;

    for (int i = 0; i < 5; ++i)
    {
        futures.push_back(runner.submit<bool>([i, &order, &order_mutex](const CancellationToken &)
                                              {
            std::this_thread::sleep_for(std::chrono::milliseconds(5 - i));
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
            return true; }));
    }
    for (auto &future : futures)
    {
        EXPECT_TRUE(future.get());
    }
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(JobRunnerTest, ExceptionIsDeliveredThroughFuture)
{
    JobRunner runner;
    auto failing = runner.submit<std::string>([](const CancellationToken &) -> std::string
                                              { throw std::runtime_error("report folder missing"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    // The worker survives and runs the next job
    auto next = runner.submit<std::string>([](const CancellationToken &)
                                           { return std::string("ok"); });
    EXPECT_EQ(next.get(), "ok");
}

TEST(JobRunnerTest, CancelReachesRunningJob)
{
    JobRunner runner;
    auto future = runner.submit<int>([](const CancellationToken &token)
                                     {
        int iterations = 0;
        while (!token.isCancelled() && iterations < 1000)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            iterations++;
        }
        return iterations; });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    runner.cancel();
    EXPECT_LT(future.get(), 1000);
    EXPECT_TRUE(runner.isCancelled());
    EXPECT_TRUE(runner.token().isCancelled());
}

TEST(JobRunnerTest, WaitForCompletionDrainsQueue)
{
    JobRunner runner;
    std::atomic<int> done{0};
    for (int i = 0; i < 3; ++i)
    {
        runner.submit<bool>([&done](const CancellationToken &)
                            {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            done++;
            return true; });
    }
    runner.wait_for_completion();
    EXPECT_EQ(done.load(), 3);
    EXPECT_EQ(runner.getPendingCount(), 0u);
}

TEST(JobRunnerTest, StopRightAfterJobNeverHangs)
{
    // Stop lands while the worker goes back to waiting for the next job
    for (int i = 0; i < 200; ++i)
    {
        JobRunner runner;
        auto future = runner.submit<int>([i](const CancellationToken &)
                                         { return i; });
        EXPECT_EQ(future.get(), i);
        runner.stop();
    }
}
