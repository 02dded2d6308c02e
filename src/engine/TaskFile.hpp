#pragma once

#include "engine/TaskConfig.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pd::engine
{

class TaskRegistry;

// One entry of a task definition file. Intervals in the file are seconds.
struct TaskDefinition
{
    std::string name;
    std::string description;
    std::string command;
    TaskOptions options;
};

// Parses {"tasks":[{...}, ...]}. Throws ConfigError on malformed JSON,
// a missing name or command, or values of the wrong type.
std::vector<TaskDefinition> parse_task_definitions(std::string_view payload);
std::vector<TaskDefinition> load_task_file(std::filesystem::path const &path);

// Registers each definition with a CommandWork unit. Returns the count.
std::size_t register_task_definitions(
    TaskRegistry &registry, std::vector<TaskDefinition> const &definitions);

} // namespace pd::engine
