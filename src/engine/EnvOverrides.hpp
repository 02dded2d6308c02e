#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pd::engine
{

inline constexpr char kOverridesEnvVar[] = "PERIODICAL";

// One `name[:interval]` entry. Naming a task activates it.
struct EnvOverride
{
    bool active = true;
    std::optional<std::chrono::milliseconds> execution_interval;
};

using EnvOverrides = std::unordered_map<std::string, EnvOverride>;

// Parses "name[:seconds],name[:seconds],...". Blank entries are skipped,
// whitespace around names and intervals is ignored, a repeated name keeps
// the last entry. Throws ConfigError when an interval is not a positive
// integer.
EnvOverrides parse_env_overrides(std::string_view raw);

// The parsed PERIODICAL variable. Read on first call and cached for the
// life of the process; later changes to the environment are not seen.
EnvOverrides const &process_env_overrides();

} // namespace pd::engine
