#include "engine/TimerService.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace pd::engine
{

TimerService::~TimerService()
{
    stop();
}

void TimerService::start()
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (thread_.joinable())
    {
        return;
    }
    stopping_ = false;
    thread_ = std::thread([this] { loop(); });
}

void TimerService::stop()
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
    {
        thread_.join();
    }
    std::lock_guard<std::mutex> guard(mutex_);
    timers_ = decltype(timers_){};
    live_.clear();
}

auto TimerService::schedule_at(Clock::time_point due, Callback callback)
    -> TimerId
{
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (stopping_)
        {
            return 0;
        }
        id = next_id_++;
        timers_.push({id, due, std::move(callback)});
        live_.insert(id);
    }
    cv_.notify_all();
    return id;
}

auto TimerService::schedule_after(std::chrono::milliseconds delay,
                                  Callback callback) -> TimerId
{
    return schedule_at(Clock::now() + delay, std::move(callback));
}

bool TimerService::cancel(TimerId id)
{
    std::lock_guard<std::mutex> guard(mutex_);
    // The heap entry stays until it surfaces; loop() skips dead ids.
    return live_.erase(id) > 0;
}

std::size_t TimerService::pending() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return live_.size();
}

void TimerService::loop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_)
    {
        if (timers_.empty())
        {
            cv_.wait(lock);
            continue;
        }
        auto const due = timers_.top().due;
        if (Clock::now() < due)
        {
            cv_.wait_until(lock, due);
            continue;
        }

        Timer timer = timers_.top();
        timers_.pop();
        if (live_.erase(timer.id) == 0)
        {
            continue;
        }

        lock.unlock();
        try
        {
            if (timer.callback)
            {
                timer.callback();
            }
        }
        catch (std::exception const &ex)
        {
            PD_LOG_ERROR("timer callback exception: {}", ex.what());
        }
        catch (...)
        {
            PD_LOG_ERROR("timer callback threw a non-standard exception");
        }
        lock.lock();
    }
}

} // namespace pd::engine
