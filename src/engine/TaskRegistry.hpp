#pragma once

#include "engine/EnvOverrides.hpp"
#include "engine/TaskConfig.hpp"

#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace pd::engine
{

// Name -> resolved TaskConfig. Tasks are registered once at startup by a
// single thread; afterwards the runner, invoker and liveness query only read.
class TaskRegistry
{
  public:
    explicit TaskRegistry(EnvOverrides env = {}, TaskDefaults defaults = {});

    // Resolves and stores the task, replacing any previous registration of
    // the same name wholesale. Throws ConfigError on invalid intervals.
    void register_task(std::string const &name, std::string description,
                       WorkUnitPtr work, TaskOptions const &options = {});

    // Throws UnknownTaskError for names that were never registered.
    TaskConfig get(std::string const &name) const;

    bool contains(std::string const &name) const;
    std::vector<TaskConfig> all() const;
    std::size_t size() const;

  private:
    EnvOverrides env_;
    TaskDefaults defaults_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, TaskConfig> tasks_;
};

} // namespace pd::engine
