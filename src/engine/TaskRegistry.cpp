#include "engine/TaskRegistry.hpp"

#include "engine/ConfigurationResolver.hpp"
#include "engine/Errors.hpp"
#include "utils/Log.hpp"

#include <mutex>
#include <utility>

namespace pd::engine
{

TaskRegistry::TaskRegistry(EnvOverrides env, TaskDefaults defaults)
    : env_(std::move(env)), defaults_(defaults)
{
}

void TaskRegistry::register_task(std::string const &name,
                                 std::string description, WorkUnitPtr work,
                                 TaskOptions const &options)
{
    auto config = resolve_task_config(name, std::move(description),
                                      std::move(work), defaults_, env_,
                                      options);
    PD_LOG_DEBUG("registered task {} (interval {}ms, timeout {}ms, {})", name,
                 config.execution_interval.count(),
                 config.timeout_interval.count(),
                 config.active ? "active" : "inactive");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    tasks_.insert_or_assign(name, std::move(config));
}

TaskConfig TaskRegistry::get(std::string const &name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end())
    {
        throw UnknownTaskError(name);
    }
    return it->second;
}

bool TaskRegistry::contains(std::string const &name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tasks_.contains(name);
}

std::vector<TaskConfig> TaskRegistry::all() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<TaskConfig> result;
    result.reserve(tasks_.size());
    for (auto const &[name, config] : tasks_)
    {
        result.push_back(config);
    }
    return result;
}

std::size_t TaskRegistry::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace pd::engine
