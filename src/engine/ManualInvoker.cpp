#include "engine/ManualInvoker.hpp"

#include "engine/TaskRegistry.hpp"
#include "engine/TimedExecution.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <optional>
#include <utility>

namespace pd::engine
{

ManualInvoker::ManualInvoker(TaskRegistry const &registry,
                             std::shared_ptr<ErrorTracker> tracker,
                             std::shared_ptr<ResourceScope> resource)
    : registry_(registry), tracker_(std::move(tracker)),
      resource_(std::move(resource))
{
}

void ManualInvoker::run_once(std::string const &name) const
{
    auto const config = registry_.get(name);
    PD_LOG_INFO("running task {} once (timeout {}ms)", name,
                config.timeout_interval.count());

    auto const outcome = execute_with_timeout(config, resource_);
    if (outcome.ok())
    {
        return;
    }
    FailureObserver(name, tracker_).report(std::nullopt, outcome);
    std::rethrow_exception(outcome.error);
}

} // namespace pd::engine
