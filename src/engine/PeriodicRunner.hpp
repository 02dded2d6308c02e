#pragma once

#include "engine/FailureObserver.hpp"
#include "engine/ResourceScope.hpp"
#include "engine/RunOutcome.hpp"
#include "engine/TaskConfig.hpp"
#include "engine/TimerService.hpp"
#include "engine/WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pd::engine
{

class TaskRegistry;

// Delay until the next multiple of `interval` counted from the Unix epoch.
// A `now` already on a boundary yields a full interval.
std::chrono::milliseconds alignment_delay(
    std::chrono::milliseconds interval,
    std::chrono::system_clock::time_point now);

// Delay before the first execution of an activated task.
std::chrono::milliseconds first_run_delay(
    TaskConfig const &config, std::chrono::system_clock::time_point now);

// Live schedule of one active task.
class TaskHandle
{
  public:
    TaskHandle(TaskConfig config, FailureObserver observer,
               std::weak_ptr<TimerService> timers);

    std::string const &name() const noexcept { return config_.name; }
    TaskConfig const &config() const noexcept { return config_; }

    // Cancels the pending execution and prevents any further ones. A run
    // already in progress is allowed to settle.
    void stop();
    bool is_stopped() const noexcept;

    std::uint64_t executions() const noexcept;
    std::uint64_t failures() const noexcept;
    std::optional<std::chrono::system_clock::time_point> last_settled_at() const;

  private:
    friend class PeriodicRunner;

    // Returns false once stopped; the caller must then not arm a timer.
    bool set_timer(TimerService::TimerId id);
    void record(RunOutcome const &outcome,
                std::chrono::system_clock::time_point settled_at);

    TaskConfig const config_;
    FailureObserver const observer_;
    std::weak_ptr<TimerService> timers_;

    mutable std::mutex mutex_;
    TimerService::TimerId timer_id_ = 0;
    std::optional<std::chrono::system_clock::time_point> last_settled_at_;
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> executions_{0};
    std::atomic<std::uint64_t> failures_{0};
};

using TaskHandlePtr = std::shared_ptr<TaskHandle>;

// Starts one fixed-delay recurring schedule per active task in a registry.
//
// Each schedule re-arms a single-shot timer only after its previous run has
// settled, so runs of one task never overlap; different tasks run in
// parallel on the worker pool.
class PeriodicRunner
{
  public:
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    struct Options
    {
        std::size_t workers = 4;
        std::shared_ptr<ResourceScope> resource;
        std::shared_ptr<ErrorTracker> tracker;
        WallClock wall_clock;
    };

    explicit PeriodicRunner(TaskRegistry const &registry);
    PeriodicRunner(TaskRegistry const &registry, Options options);
    PeriodicRunner(PeriodicRunner const &) = delete;
    PeriodicRunner &operator=(PeriodicRunner const &) = delete;
    ~PeriodicRunner();

    // Activates every active task and returns their handles. Inactive tasks
    // get no handle. Calling run() again returns the existing handles.
    std::vector<TaskHandlePtr> run();

    // Stops all handles, then joins the timer thread and the worker pool.
    void stop();

    bool is_running() const noexcept;

  private:
    void arm(TaskHandlePtr const &handle, std::chrono::milliseconds delay);
    void execute(TaskHandlePtr const &handle);
    std::chrono::system_clock::time_point wall_now() const;

    TaskRegistry const &registry_;
    Options options_;
    std::shared_ptr<TimerService> timers_;
    WorkerPool pool_;

    mutable std::mutex mutex_;
    std::vector<TaskHandlePtr> handles_;
    std::atomic<bool> running_{false};
};

} // namespace pd::engine
