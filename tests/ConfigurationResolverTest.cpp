#include "engine/ConfigurationResolver.hpp"
#include "engine/Errors.hpp"

#include <chrono>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using pd::engine::EnvOverrides;
using pd::engine::TaskDefaults;
using pd::engine::TaskOptions;

TEST_CASE("resolve_task_config starts from the built-in defaults")
{
    auto config = pd::engine::resolve_task_config(
        "sweep", "removes stale rows", pd::engine::make_work([] {}),
        TaskDefaults{}, EnvOverrides{}, TaskOptions{});

    CHECK(config.name == "sweep");
    CHECK(config.description == "removes stale rows");
    CHECK(config.work != nullptr);
    CHECK(config.execution_interval == 60s);
    CHECK(config.timeout_interval == 10s);
    CHECK_FALSE(config.active);
    CHECK(config.run_immediately_on_start);
    CHECK_FALSE(config.consistent_start_time);
}

TEST_CASE("environment entry activates the task and overrides the interval")
{
    EnvOverrides env = pd::engine::parse_env_overrides("sweep:9");
    auto config = pd::engine::resolve_task_config(
        "sweep", "", pd::engine::make_work([] {}), TaskDefaults{}, env,
        TaskOptions{});

    CHECK(config.active);
    CHECK(config.execution_interval == 9s);
    CHECK(config.timeout_interval == 10s);
}

TEST_CASE("environment entries for other tasks are ignored")
{
    EnvOverrides env = pd::engine::parse_env_overrides("other:9");
    auto config = pd::engine::resolve_task_config(
        "sweep", "", pd::engine::make_work([] {}), TaskDefaults{}, env,
        TaskOptions{});

    CHECK_FALSE(config.active);
    CHECK(config.execution_interval == 60s);
}

TEST_CASE("call-site options win over the environment")
{
    EnvOverrides env = pd::engine::parse_env_overrides("x:9");
    TaskOptions options;
    options.execution_interval = 5s;
    auto config = pd::engine::resolve_task_config(
        "x", "", pd::engine::make_work([] {}), TaskDefaults{}, env, options);

    CHECK(config.execution_interval == 5s);
    CHECK(config.active);

    options.active = false;
    auto disabled = pd::engine::resolve_task_config(
        "x", "", pd::engine::make_work([] {}), TaskDefaults{}, env, options);
    CHECK_FALSE(disabled.active);
}

TEST_CASE("custom defaults are the lowest layer")
{
    TaskDefaults defaults;
    defaults.timeout_interval = 2s;
    defaults.run_immediately_on_start = false;
    auto config = pd::engine::resolve_task_config(
        "x", "", pd::engine::make_work([] {}), defaults, EnvOverrides{},
        TaskOptions{});

    CHECK(config.timeout_interval == 2s);
    CHECK_FALSE(config.run_immediately_on_start);
}

TEST_CASE("non-positive intervals are rejected")
{
    TaskOptions options;
    options.timeout_interval = 0ms;
    CHECK_THROWS_AS(pd::engine::resolve_task_config(
                        "x", "", pd::engine::make_work([] {}), TaskDefaults{},
                        EnvOverrides{}, options),
                    pd::engine::ConfigError);
}

TEST_CASE("intervals longer than a year are rejected")
{
    TaskOptions options;
    options.execution_interval = pd::engine::kMaxInterval + 1ms;
    CHECK_THROWS_AS(pd::engine::resolve_task_config(
                        "x", "", pd::engine::make_work([] {}), TaskDefaults{},
                        EnvOverrides{}, options),
                    pd::engine::ConfigError);

    options.execution_interval = pd::engine::kMaxInterval;
    CHECK(pd::engine::resolve_task_config("x", "",
                                          pd::engine::make_work([] {}),
                                          TaskDefaults{}, EnvOverrides{},
                                          options)
              .execution_interval == pd::engine::kMaxInterval);
}
