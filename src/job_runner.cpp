#include "core/job_runner.hpp"
#include "logging/logger.hpp"

JobRunner::JobRunner()
{
    worker_ = std::thread(&JobRunner::worker_thread, this);
}

JobRunner::~JobRunner()
{
    stop();
    if (worker_.joinable())
    {
        worker_.join();
    }
}

void JobRunner::enqueue(Job job)
{
    Logger::debug("Enqueueing job");
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
}

void JobRunner::cancel()
{
    Logger::info("Cancelling running job");
    token_.cancel();
}

void JobRunner::wait_for_completion()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]
                  { return (job_queue_.empty() && !busy_) || should_stop_; });
}

void JobRunner::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();
}

size_t JobRunner::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.size();
}

void JobRunner::worker_thread()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !job_queue_.empty() || should_stop_; });

            if (should_stop_ && job_queue_.empty())
            {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
            busy_ = true;
        }

        Logger::debug("Executing job on worker thread");
        // Exceptions are captured into the job's promise
        job();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
            if (job_queue_.empty())
            {
                idle_cv_.notify_all();
            }
        }
    }
}
