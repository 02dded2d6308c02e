#include "engine/EnvOverrides.hpp"

#include "engine/Errors.hpp"
#include "engine/TaskConfig.hpp"
#include "utils/Log.hpp"

#include <charconv>
#include <cstdlib>
#include <format>

namespace pd::engine
{

namespace
{

std::string_view trim_whitespace(std::string_view value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::chrono::milliseconds parse_interval(std::string_view name,
                                         std::string_view text)
{
    long long seconds = 0;
    auto const *first = text.data();
    auto const *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (text.empty() || ec != std::errc{} || ptr != last)
    {
        throw ConfigError(std::format(
            "{}: invalid interval '{}' for task '{}'", kOverridesEnvVar, text,
            name));
    }
    if (seconds <= 0)
    {
        throw ConfigError(std::format(
            "{}: interval for task '{}' must be positive, got {}",
            kOverridesEnvVar, name, seconds));
    }
    if (seconds > std::chrono::duration_cast<std::chrono::seconds>(kMaxInterval)
                      .count())
    {
        throw ConfigError(std::format(
            "{}: interval for task '{}' exceeds one year, got {}s",
            kOverridesEnvVar, name, seconds));
    }
    return std::chrono::seconds(seconds);
}

} // namespace

EnvOverrides parse_env_overrides(std::string_view raw)
{
    EnvOverrides result;
    while (!raw.empty())
    {
        auto comma = raw.find(',');
        auto item = trim_whitespace(raw.substr(0, comma));
        raw = comma == std::string_view::npos ? std::string_view{}
                                              : raw.substr(comma + 1);
        if (item.empty())
        {
            continue;
        }

        EnvOverride entry;
        std::string_view name = item;
        auto colon = item.find(':');
        if (colon != std::string_view::npos)
        {
            name = trim_whitespace(item.substr(0, colon));
            entry.execution_interval =
                parse_interval(name, trim_whitespace(item.substr(colon + 1)));
        }
        if (name.empty())
        {
            throw ConfigError(std::format("{}: entry '{}' has no task name",
                                          kOverridesEnvVar, item));
        }
        result[std::string(name)] = entry;
    }
    return result;
}

EnvOverrides const &process_env_overrides()
{
    static EnvOverrides const overrides = []
    {
        auto const *raw = std::getenv(kOverridesEnvVar);
        auto parsed = parse_env_overrides(raw ? std::string_view(raw)
                                              : std::string_view{});
        if (!parsed.empty())
        {
            PD_LOG_INFO("{} activates {} task(s)", kOverridesEnvVar,
                        parsed.size());
        }
        return parsed;
    }();
    return overrides;
}

} // namespace pd::engine
