#include "engine/Errors.hpp"
#include "engine/TaskRegistry.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;

TEST_CASE("TaskRegistry stores resolved configuration by name")
{
    pd::engine::TaskRegistry registry(
        pd::engine::parse_env_overrides("reindex"));
    registry.register_task("reindex", "rebuild search index",
                           pd::engine::make_work([] {}));

    REQUIRE(registry.contains("reindex"));
    auto config = registry.get("reindex");
    CHECK(config.description == "rebuild search index");
    CHECK(config.active);
    CHECK(config.execution_interval == 60s);
}

TEST_CASE("re-registering a name replaces the previous entry wholesale")
{
    pd::engine::TaskRegistry registry;
    pd::engine::TaskOptions first;
    first.execution_interval = 5s;
    first.active = true;
    registry.register_task("sync", "first", pd::engine::make_work([] {}),
                           first);

    pd::engine::TaskOptions second;
    second.timeout_interval = 3s;
    registry.register_task("sync", "second", pd::engine::make_work([] {}),
                           second);

    auto config = registry.get("sync");
    CHECK(registry.size() == 1);
    CHECK(config.description == "second");
    CHECK(config.timeout_interval == 3s);
    CHECK(config.execution_interval == 60s);
    CHECK_FALSE(config.active);
}

TEST_CASE("TaskRegistry::get throws for unknown names")
{
    pd::engine::TaskRegistry registry;
    CHECK_FALSE(registry.contains("missing"));
    CHECK_THROWS_AS(registry.get("missing"), pd::engine::UnknownTaskError);
}

TEST_CASE("TaskRegistry::all lists every registration")
{
    pd::engine::TaskRegistry registry;
    registry.register_task("a", "", pd::engine::make_work([] {}));
    registry.register_task("b", "", pd::engine::make_work([] {}));
    registry.register_task("c", "", pd::engine::make_work([] {}));

    auto all = registry.all();
    REQUIRE(all.size() == 3);
    std::vector<std::string> names;
    for (auto const &config : all)
    {
        names.push_back(config.name);
    }
    std::sort(names.begin(), names.end());
    CHECK(names == std::vector<std::string>{"a", "b", "c"});
}
