#pragma once

#include "core/cancellation_token.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

/**
 * @brief Runs scan and repair jobs on one background worker thread.
 *
 * Jobs execute strictly one at a time in submission order. Each job
 * receives the runner's cancellation token and hands its result back
 * through a std::future; an exception thrown by the job is delivered
 * through the same future.
 */
class JobRunner
{
public:
    using Job = std::function<void()>;

    JobRunner();
    ~JobRunner();

    JobRunner(const JobRunner &) = delete;
    JobRunner &operator=(const JobRunner &) = delete;

    template <typename Result>
    std::future<Result> submit(std::function<Result(const CancellationToken &)> job)
    {
        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> future = promise->get_future();
        CancellationToken token = token_;

        enqueue([job = std::move(job), promise, token]()
                {
            try
            {
                promise->set_value(job(token));
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            } });
        return future;
    }

    // Ask the running job to stop; queued jobs still run and see the flag
    void cancel();
    bool isCancelled() const { return token_.isCancelled(); }
    const CancellationToken &token() const { return token_; }

    // Block until the queue is empty and no job is running
    void wait_for_completion();

    // Finish the queued jobs, then end the worker
    void stop();

    size_t getPendingCount() const;

private:
    void enqueue(Job job);
    void worker_thread();

    CancellationToken token_;
    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::thread worker_;
    std::atomic<bool> should_stop_{false};
    bool busy_ = false;
};
