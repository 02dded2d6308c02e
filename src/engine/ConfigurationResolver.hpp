#pragma once

#include "engine/EnvOverrides.hpp"
#include "engine/TaskConfig.hpp"

#include <string>

namespace pd::engine
{

// Layers a task's configuration: defaults, then the environment entry for
// `name` (if any), then the call-site options. Work unit and description
// always come from the caller. Throws ConfigError when an interval ends up
// non-positive.
TaskConfig resolve_task_config(std::string name, std::string description,
                               WorkUnitPtr work, TaskDefaults const &defaults,
                               EnvOverrides const &env,
                               TaskOptions const &options);

} // namespace pd::engine
