#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace pd::engine
{

class TaskRegistry;

// Health-check view over the registry. Works for both the in-process runner
// and cron-driven run_once setups, since it only looks at configuration.
class LivenessQuery
{
  public:
    using Clock = std::chrono::system_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit LivenessQuery(TaskRegistry const &registry, ClockFn clock = {});

    // True iff `since` is strictly older than now - 2 * execution_interval,
    // i.e. more than one cycle has been missed.
    bool overdue(std::string const &name, Clock::time_point since) const;

    // execution_interval for active tasks, nullopt for inactive ones.
    std::optional<std::chrono::milliseconds>
    interval(std::string const &name) const;

  private:
    Clock::time_point now() const;

    TaskRegistry const &registry_;
    ClockFn clock_;
};

} // namespace pd::engine
