#include "TestUtils.hpp"
#include "app/DaemonMain.hpp"
#include "utils/Shutdown.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <doctest/doctest.h>

namespace
{

int invoke(std::vector<std::string> args)
{
    args.insert(args.begin(), "periodical");
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &arg : args)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return pd::app::daemon_main(static_cast<int>(args.size()), argv.data());
}

std::string write_task_file(std::filesystem::path const &root)
{
    auto path = root / "periodical.json";
    std::ofstream out(path);
    out << R"({"tasks": [
        {"name": "ok", "command": "true", "active": true, "execution_interval": 60},
        {"name": "broken", "command": "exit 7", "timeout_interval": 5},
        {"name": "idle", "command": "true"}
    ]})";
    return path.string();
}

} // namespace

TEST_CASE("daemon run-once exit status reflects the task outcome")
{
    auto tasks = write_task_file(pd::tests::make_temp_root("daemon-run-once"));

    CHECK(invoke({"--tasks", tasks, "run-once", "ok"}) == pd::app::kExitOk);
    CHECK(invoke({"--tasks", tasks, "run-once", "broken"}) ==
          pd::app::kExitTaskFailed);
    CHECK(invoke({"--tasks", tasks, "run-once", "ghost"}) ==
          pd::app::kExitUsage);
}

TEST_CASE("daemon overdue compares against twice the interval")
{
    auto tasks = write_task_file(pd::tests::make_temp_root("daemon-overdue"));
    auto const now = static_cast<long long>(std::time(nullptr));

    CHECK(invoke({"--tasks", tasks, "overdue", "ok", std::to_string(now - 30)}) ==
          pd::app::kExitOk);
    CHECK(invoke({"--tasks", tasks, "overdue", "ok",
                  std::to_string(now - 600)}) == pd::app::kExitTaskFailed);
    CHECK(invoke({"--tasks", tasks, "overdue", "ok", "yesterday"}) ==
          pd::app::kExitUsage);
    CHECK(invoke({"--tasks", tasks, "overdue", "ok",
                  "9223372036854775807"}) == pd::app::kExitUsage);
    CHECK(invoke({"--tasks", tasks, "overdue", "ok",
                  "-9300000000000000"}) == pd::app::kExitUsage);
}

TEST_CASE("daemon rejects bad usage and configuration")
{
    auto root = pd::tests::make_temp_root("daemon-usage");
    auto tasks = write_task_file(root);

    CHECK(invoke({}) == pd::app::kExitUsage);
    CHECK(invoke({"--help"}) == pd::app::kExitOk);
    CHECK(invoke({"--version"}) == pd::app::kExitOk);
    CHECK(invoke({"--tasks", tasks, "list"}) == pd::app::kExitOk);
    CHECK(invoke({"--tasks", tasks, "frobnicate"}) == pd::app::kExitUsage);
    CHECK(invoke({"--tasks", (root / "missing.json").string(), "list"}) ==
          pd::app::kExitUsage);
}

TEST_CASE("daemon run returns once shutdown is requested")
{
    auto tasks = write_task_file(pd::tests::make_temp_root("daemon-run"));
    pd::runtime::request_shutdown();
    CHECK(invoke({"--tasks", tasks, "run"}) == pd::app::kExitOk);
}
