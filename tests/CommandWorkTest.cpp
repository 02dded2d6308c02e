#include "TestUtils.hpp"
#include "engine/CommandWork.hpp"
#include "engine/Errors.hpp"
#include "engine/ManualInvoker.hpp"
#include "engine/TaskRegistry.hpp"
#include "utils/Subprocess.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include <doctest/doctest.h>

using namespace std::chrono_literals;

TEST_CASE("CommandWork succeeds on exit status zero")
{
    auto root = pd::tests::make_temp_root("command-ok");
    auto marker = root / "ran";
    pd::engine::CommandWork work("touch '" + marker.string() + "'");
    CHECK(work.command() == "touch '" + marker.string() + "'");
    work.execute();
    CHECK(std::filesystem::exists(marker));
}

TEST_CASE("CommandWork raises on a non-zero exit status")
{
    pd::engine::CommandWork work("exit 3");
    try
    {
        work.execute();
        FAIL("expected CommandFailedError");
    }
    catch (pd::engine::CommandFailedError const &ex)
    {
        CHECK(ex.exit_code() == 3);
        CHECK(std::string(ex.what()) == "command exited with status 3: exit 3");
    }
}

TEST_CASE("a timed-out command is terminated before run_once returns")
{
    auto root = pd::tests::make_temp_root("command-timeout");
    auto marker = root / "survived";
    pd::engine::TaskRegistry registry;
    pd::engine::TaskOptions options;
    options.timeout_interval = 100ms;
    registry.register_task(
        "sleeper", "",
        std::make_shared<pd::engine::CommandWork>(
            "sleep 1; touch '" + marker.string() + "'"),
        options);

    pd::engine::ManualInvoker invoker(registry);
    auto const started = std::chrono::steady_clock::now();
    try
    {
        invoker.run_once("sleeper");
        FAIL("expected TaskTimeoutError");
    }
    catch (pd::engine::TaskTimeoutError const &ex)
    {
        CHECK(ex.timeout() == 100ms);
    }
    CHECK(std::chrono::steady_clock::now() - started < 1s);

    std::this_thread::sleep_for(1500ms);
    CHECK_FALSE(std::filesystem::exists(marker));
}

TEST_CASE("a command ignoring SIGTERM is killed after the grace period")
{
    auto root = pd::tests::make_temp_root("command-kill");
    auto marker = root / "survived";
    auto const started = std::chrono::steady_clock::now();
    auto const result = pd::utils::run_shell_command(
        "trap '' TERM; sleep 1; touch '" + marker.string() + "'",
        [started]
        { return std::chrono::steady_clock::now() - started >= 200ms; },
        10ms, 100ms);

    CHECK(result.cancelled);
    CHECK(result.term_signal == SIGKILL);
    std::this_thread::sleep_for(1500ms);
    CHECK_FALSE(std::filesystem::exists(marker));
}
