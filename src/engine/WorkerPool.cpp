#include "engine/WorkerPool.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace pd::engine
{

WorkerPool::WorkerPool(std::size_t threads)
    : thread_count_(threads == 0 ? 1 : threads)
{
}

WorkerPool::~WorkerPool()
{
    stop();
}

void WorkerPool::start()
{
    if (!workers_.empty())
    {
        return;
    }
    exit_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    workers_.reserve(thread_count_);
    for (std::size_t i = 0; i < thread_count_; ++i)
    {
        workers_.emplace_back([this] { loop(); });
    }
}

void WorkerPool::stop()
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    for (auto &worker : workers_)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    workers_.clear();
    running_.store(false, std::memory_order_release);
}

bool WorkerPool::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

bool WorkerPool::submit(std::function<void()> job)
{
    if (!job)
    {
        return false;
    }
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (exit_requested_.load(std::memory_order_acquire))
        {
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::loop()
{
    while (true)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock,
                     [this]
                     {
                         return exit_requested_.load(
                                    std::memory_order_acquire) ||
                                !jobs_.empty();
                     });
            if (jobs_.empty())
            {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        try
        {
            job();
        }
        catch (std::exception const &ex)
        {
            PD_LOG_ERROR("worker job exception: {}", ex.what());
        }
        catch (...)
        {
            PD_LOG_ERROR("worker job threw a non-standard exception");
        }
    }
}

} // namespace pd::engine
