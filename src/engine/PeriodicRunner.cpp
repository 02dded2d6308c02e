#include "engine/PeriodicRunner.hpp"

#include "engine/TaskRegistry.hpp"
#include "engine/TimedExecution.hpp"
#include "utils/Log.hpp"

#include <utility>

namespace pd::engine
{

std::chrono::milliseconds alignment_delay(
    std::chrono::milliseconds interval,
    std::chrono::system_clock::time_point now)
{
    auto const since_epoch =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch());
    return interval - (since_epoch % interval);
}

std::chrono::milliseconds first_run_delay(
    TaskConfig const &config, std::chrono::system_clock::time_point now)
{
    std::chrono::milliseconds delay{0};
    if (config.consistent_start_time)
    {
        delay = alignment_delay(config.execution_interval, now);
    }
    if (!config.run_immediately_on_start)
    {
        delay += config.execution_interval;
    }
    return delay;
}

TaskHandle::TaskHandle(TaskConfig config, FailureObserver observer,
                       std::weak_ptr<TimerService> timers)
    : config_(std::move(config)), observer_(std::move(observer)),
      timers_(std::move(timers))
{
}

void TaskHandle::stop()
{
    if (stopped_.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    TimerService::TimerId id = 0;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        id = timer_id_;
    }
    if (auto timers = timers_.lock(); timers && id != 0)
    {
        timers->cancel(id);
    }
    PD_LOG_INFO("stopped periodical task {}", config_.name);
}

bool TaskHandle::is_stopped() const noexcept
{
    return stopped_.load(std::memory_order_acquire);
}

std::uint64_t TaskHandle::executions() const noexcept
{
    return executions_.load(std::memory_order_acquire);
}

std::uint64_t TaskHandle::failures() const noexcept
{
    return failures_.load(std::memory_order_acquire);
}

std::optional<std::chrono::system_clock::time_point>
TaskHandle::last_settled_at() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return last_settled_at_;
}

bool TaskHandle::set_timer(TimerService::TimerId id)
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (is_stopped())
    {
        return false;
    }
    // A zero-delay timer may already have fired and re-armed with a newer id.
    if (id > timer_id_)
    {
        timer_id_ = id;
    }
    return true;
}

void TaskHandle::record(RunOutcome const &outcome,
                        std::chrono::system_clock::time_point settled_at)
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        last_settled_at_ = settled_at;
    }
    if (!outcome.ok())
    {
        failures_.fetch_add(1, std::memory_order_acq_rel);
    }
    executions_.fetch_add(1, std::memory_order_acq_rel);
}

PeriodicRunner::PeriodicRunner(TaskRegistry const &registry)
    : PeriodicRunner(registry, Options{})
{
}

PeriodicRunner::PeriodicRunner(TaskRegistry const &registry, Options options)
    : registry_(registry), options_(std::move(options)),
      timers_(std::make_shared<TimerService>()), pool_(options_.workers)
{
}

PeriodicRunner::~PeriodicRunner()
{
    stop();
}

std::vector<TaskHandlePtr> PeriodicRunner::run()
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (running_.load(std::memory_order_acquire))
    {
        return handles_;
    }
    timers_->start();
    pool_.start();
    running_.store(true, std::memory_order_release);

    for (auto &config : registry_.all())
    {
        if (!config.active)
        {
            continue;
        }
        auto const delay = first_run_delay(config, wall_now());
        FailureObserver observer(config.name, options_.tracker);
        auto handle = std::make_shared<TaskHandle>(
            std::move(config), std::move(observer), timers_);
        PD_LOG_INFO("starting periodical task {} every {}ms, first run in {}ms",
                    handle->name(), handle->config().execution_interval.count(),
                    delay.count());
        handles_.push_back(handle);
        arm(handle, delay);
    }
    return handles_;
}

void PeriodicRunner::stop()
{
    std::vector<TaskHandlePtr> handles;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        running_.store(false, std::memory_order_release);
        handles.swap(handles_);
    }
    for (auto const &handle : handles)
    {
        handle->stop();
    }
    timers_->stop();
    pool_.stop();
}

bool PeriodicRunner::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

void PeriodicRunner::arm(TaskHandlePtr const &handle,
                         std::chrono::milliseconds delay)
{
    if (handle->is_stopped())
    {
        return;
    }
    std::weak_ptr<TaskHandle> weak = handle;
    auto const id = timers_->schedule_after(
        delay,
        [this, weak]
        {
            auto task = weak.lock();
            if (!task || task->is_stopped())
            {
                return;
            }
            if (!pool_.submit([this, task] { execute(task); }))
            {
                PD_LOG_DEBUG("worker pool stopping; dropped run of {}",
                             task->name());
            }
        });
    if (id != 0 && !handle->set_timer(id))
    {
        timers_->cancel(id);
    }
}

void PeriodicRunner::execute(TaskHandlePtr const &handle)
{
    if (handle->is_stopped())
    {
        return;
    }
    auto const outcome = execute_with_timeout(handle->config(),
                                              options_.resource);
    auto const settled_at = wall_now();
    handle->record(outcome, settled_at);
    handle->observer_.report(settled_at, outcome);
    arm(handle, handle->config().execution_interval);
}

std::chrono::system_clock::time_point PeriodicRunner::wall_now() const
{
    return options_.wall_clock ? options_.wall_clock()
                               : std::chrono::system_clock::now();
}

} // namespace pd::engine
