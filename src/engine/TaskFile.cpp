#include "engine/TaskFile.hpp"

#include "engine/CommandWork.hpp"
#include "engine/Errors.hpp"
#include "engine/TaskRegistry.hpp"
#include "utils/Json.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <utility>

namespace pd::engine
{

namespace
{

std::optional<std::string> read_string(yyjson_val *entry, char const *key,
                                       std::size_t index)
{
    auto *value = yyjson_obj_get(entry, key);
    if (value == nullptr || yyjson_is_null(value))
    {
        return std::nullopt;
    }
    if (!yyjson_is_str(value))
    {
        throw ConfigError(
            std::format("tasks[{}].{} must be a string", index, key));
    }
    return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

std::optional<bool> read_bool(yyjson_val *entry, char const *key,
                              std::size_t index)
{
    auto *value = yyjson_obj_get(entry, key);
    if (value == nullptr || yyjson_is_null(value))
    {
        return std::nullopt;
    }
    if (!yyjson_is_bool(value))
    {
        throw ConfigError(
            std::format("tasks[{}].{} must be a boolean", index, key));
    }
    return yyjson_get_bool(value);
}

std::optional<std::chrono::milliseconds>
read_seconds(yyjson_val *entry, char const *key, std::size_t index)
{
    auto *value = yyjson_obj_get(entry, key);
    if (value == nullptr || yyjson_is_null(value))
    {
        return std::nullopt;
    }
    std::int64_t seconds = 0;
    if (yyjson_is_sint(value))
    {
        seconds = yyjson_get_sint(value);
    }
    else if (yyjson_is_uint(value))
    {
        auto const raw = yyjson_get_uint(value);
        seconds = raw > static_cast<std::uint64_t>(INT64_MAX)
                      ? INT64_MAX
                      : static_cast<std::int64_t>(raw);
    }
    else
    {
        throw ConfigError(std::format(
            "tasks[{}].{} must be an integer number of seconds", index, key));
    }
    if (seconds <= 0)
    {
        throw ConfigError(
            std::format("tasks[{}].{} must be positive", index, key));
    }
    if (seconds > std::chrono::duration_cast<std::chrono::seconds>(kMaxInterval)
                      .count())
    {
        throw ConfigError(
            std::format("tasks[{}].{} exceeds one year", index, key));
    }
    return std::chrono::seconds(seconds);
}

std::vector<TaskDefinition> read_definitions(json::Document const &doc)
{
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        throw ConfigError("task file must contain a JSON object");
    }
    auto *tasks = yyjson_obj_get(root, "tasks");
    if (tasks == nullptr || !yyjson_is_arr(tasks))
    {
        throw ConfigError("task file must contain a \"tasks\" array");
    }

    std::vector<TaskDefinition> definitions;
    definitions.reserve(yyjson_arr_size(tasks));
    size_t idx = 0, limit = 0;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(tasks, idx, limit, entry)
    {
        if (!yyjson_is_obj(entry))
        {
            throw ConfigError(std::format("tasks[{}] must be an object", idx));
        }
        TaskDefinition definition;
        auto name = read_string(entry, "name", idx);
        if (!name || name->empty())
        {
            throw ConfigError(std::format("tasks[{}] is missing a name", idx));
        }
        auto command = read_string(entry, "command", idx);
        if (!command || command->empty())
        {
            throw ConfigError(
                std::format("task '{}' is missing a command", *name));
        }
        definition.name = std::move(*name);
        definition.command = std::move(*command);
        definition.description =
            read_string(entry, "description", idx).value_or(std::string{});
        definition.options.execution_interval =
            read_seconds(entry, "execution_interval", idx);
        definition.options.timeout_interval =
            read_seconds(entry, "timeout_interval", idx);
        definition.options.active = read_bool(entry, "active", idx);
        definition.options.run_immediately_on_start =
            read_bool(entry, "run_immediately_on_start", idx);
        definition.options.consistent_start_time =
            read_bool(entry, "consistent_start_time", idx);
        definitions.push_back(std::move(definition));
    }
    return definitions;
}

} // namespace

std::vector<TaskDefinition> parse_task_definitions(std::string_view payload)
{
    std::string error;
    auto doc = json::Document::parse(payload, &error);
    if (!doc.is_valid())
    {
        throw ConfigError("invalid task definitions: " + error);
    }
    return read_definitions(doc);
}

std::vector<TaskDefinition> load_task_file(std::filesystem::path const &path)
{
    std::string error;
    auto doc = json::Document::parse_file(path, &error);
    if (!doc.is_valid())
    {
        throw ConfigError(
            std::format("cannot read task file {}: {}", path.string(), error));
    }
    return read_definitions(doc);
}

std::size_t register_task_definitions(
    TaskRegistry &registry, std::vector<TaskDefinition> const &definitions)
{
    for (auto const &definition : definitions)
    {
        registry.register_task(definition.name, definition.description,
                               std::make_shared<CommandWork>(definition.command),
                               definition.options);
    }
    return definitions.size();
}

} // namespace pd::engine
