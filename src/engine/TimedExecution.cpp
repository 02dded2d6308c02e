#include "engine/TimedExecution.hpp"

#include "utils/Backtrace.hpp"
#include "utils/Log.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace pd::engine
{

namespace
{

thread_local std::atomic_bool const *t_cancel_flag = nullptr;

struct RunState
{
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    RunOutcome outcome;
    std::atomic_bool cancelled{false};
};

void run_work(std::shared_ptr<RunState> const &state, WorkUnitPtr const &work,
              std::shared_ptr<ResourceScope> const &scope)
{
    t_cancel_flag = &state->cancelled;
    RunOutcome outcome;
    try
    {
        ScopedResource lease(scope.get());
        // The checkout can be granted after the run was already abandoned.
        if (work && !state->cancelled.load(std::memory_order_acquire))
        {
            work->execute();
        }
    }
    catch (...)
    {
        outcome = RunOutcome::failure(std::current_exception(),
                                      utils::capture_backtrace());
    }
    t_cancel_flag = nullptr;
    {
        std::lock_guard<std::mutex> guard(state->mutex);
        state->outcome = std::move(outcome);
        state->done = true;
    }
    state->cv.notify_all();
}

} // namespace

bool cancellation_requested() noexcept
{
    return t_cancel_flag != nullptr &&
           t_cancel_flag->load(std::memory_order_acquire);
}

RunOutcome execute_with_timeout(TaskConfig const &config,
                                std::shared_ptr<ResourceScope> scope)
{
    auto state = std::make_shared<RunState>();
    try
    {
        std::thread(run_work, state, config.work, std::move(scope)).detach();
    }
    catch (std::system_error const &)
    {
        return RunOutcome::failure(std::current_exception());
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->cv.wait_for(lock, config.timeout_interval,
                            [&state] { return state->done; }))
    {
        state->cancelled.store(true, std::memory_order_release);
        PD_LOG_WARN("task {} exceeded its {}ms timeout; cancelling run",
                    config.name, config.timeout_interval.count());
        if (!state->cv.wait_for(lock, kCancellationGrace,
                                [&state] { return state->done; }))
        {
            PD_LOG_WARN("task {} ignored cancellation for {}ms; abandoning run",
                        config.name, kCancellationGrace.count());
        }
        return RunOutcome::timeout(config.name, config.timeout_interval);
    }
    return std::move(state->outcome);
}

} // namespace pd::engine
