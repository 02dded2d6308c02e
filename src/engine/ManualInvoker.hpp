#pragma once

#include "engine/FailureObserver.hpp"
#include "engine/ResourceScope.hpp"

#include <memory>
#include <string>

namespace pd::engine
{

class TaskRegistry;

// Runs a single task once, synchronously, for cron-style triggering from
// outside the process.
class ManualInvoker
{
  public:
    explicit ManualInvoker(TaskRegistry const &registry,
                           std::shared_ptr<ErrorTracker> tracker = nullptr,
                           std::shared_ptr<ResourceScope> resource = nullptr);

    // Runs the task bounded by its timeout_interval, whether or not it is
    // active. A failure or timeout is reported (without a timestamp) and
    // then rethrown: the work unit's own exception, or TaskTimeoutError.
    // Throws UnknownTaskError for unregistered names.
    void run_once(std::string const &name) const;

  private:
    TaskRegistry const &registry_;
    std::shared_ptr<ErrorTracker> tracker_;
    std::shared_ptr<ResourceScope> resource_;
};

} // namespace pd::engine
