#include "engine/LivenessQuery.hpp"

#include "engine/TaskRegistry.hpp"

#include <utility>

namespace pd::engine
{

LivenessQuery::LivenessQuery(TaskRegistry const &registry, ClockFn clock)
    : registry_(registry), clock_(std::move(clock))
{
}

bool LivenessQuery::overdue(std::string const &name,
                            Clock::time_point since) const
{
    auto const interval = registry_.get(name).execution_interval;
    return since < now() - 2 * interval;
}

std::optional<std::chrono::milliseconds>
LivenessQuery::interval(std::string const &name) const
{
    auto const config = registry_.get(name);
    if (!config.active)
    {
        return std::nullopt;
    }
    return config.execution_interval;
}

LivenessQuery::Clock::time_point LivenessQuery::now() const
{
    return clock_ ? clock_() : Clock::now();
}

} // namespace pd::engine
