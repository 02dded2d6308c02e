#pragma once

#include "engine/RunOutcome.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pd::engine
{

struct FailureReport
{
    std::string task;
    // Absent for manual invocations.
    std::optional<std::chrono::system_clock::time_point> time;
    RunStatus status = RunStatus::Failed;
    std::string message;
    std::vector<std::string> backtrace;

    // {"task":..,"time":..,"kind":..,"message":..,"backtrace":[..]}
    std::string to_json() const;
};

// External error-tracking service that receives every failed run.
class ErrorTracker
{
  public:
    virtual ~ErrorTracker() = default;
    virtual void notify(FailureReport const &report) = 0;
};

// Reports failed runs of one task to the log and the error tracker.
// Attached to both scheduled and manual runs.
class FailureObserver
{
  public:
    explicit FailureObserver(std::string task_name,
                             std::shared_ptr<ErrorTracker> tracker = nullptr);

    // No-op for successful outcomes. Never throws; failures while reporting
    // are written to stderr and dropped.
    void report(std::optional<std::chrono::system_clock::time_point> time,
                RunOutcome const &outcome) const noexcept;

    std::string const &task_name() const noexcept { return task_name_; }

  private:
    std::string task_name_;
    std::shared_ptr<ErrorTracker> tracker_;
};

} // namespace pd::engine
