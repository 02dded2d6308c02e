#include "engine/ConfigurationResolver.hpp"

#include "engine/Errors.hpp"

#include <format>
#include <utility>

namespace pd::engine
{

namespace
{

void require_in_range(std::string const &name, char const *field,
                      std::chrono::milliseconds value)
{
    if (value.count() <= 0)
    {
        throw ConfigError(std::format("task '{}': {} must be positive, got {}ms",
                                      name, field, value.count()));
    }
    if (value > kMaxInterval)
    {
        throw ConfigError(std::format("task '{}': {} exceeds one year, got {}ms",
                                      name, field, value.count()));
    }
}

} // namespace

TaskConfig resolve_task_config(std::string name, std::string description,
                               WorkUnitPtr work, TaskDefaults const &defaults,
                               EnvOverrides const &env,
                               TaskOptions const &options)
{
    TaskConfig config;
    config.execution_interval = defaults.execution_interval;
    config.timeout_interval = defaults.timeout_interval;
    config.active = defaults.active;
    config.run_immediately_on_start = defaults.run_immediately_on_start;
    config.consistent_start_time = defaults.consistent_start_time;

    if (auto it = env.find(name); it != env.end())
    {
        config.active = it->second.active;
        if (it->second.execution_interval)
        {
            config.execution_interval = *it->second.execution_interval;
        }
    }

    if (options.execution_interval)
        config.execution_interval = *options.execution_interval;
    if (options.timeout_interval)
        config.timeout_interval = *options.timeout_interval;
    if (options.active)
        config.active = *options.active;
    if (options.run_immediately_on_start)
        config.run_immediately_on_start = *options.run_immediately_on_start;
    if (options.consistent_start_time)
        config.consistent_start_time = *options.consistent_start_time;

    require_in_range(name, "execution_interval", config.execution_interval);
    require_in_range(name, "timeout_interval", config.timeout_interval);

    config.name = std::move(name);
    config.description = std::move(description);
    config.work = std::move(work);
    return config;
}

} // namespace pd::engine
