#include "app/DaemonMain.hpp"

#include "engine/EnvOverrides.hpp"
#include "engine/Errors.hpp"
#include "engine/LivenessQuery.hpp"
#include "engine/ManualInvoker.hpp"
#include "engine/PeriodicRunner.hpp"
#include "engine/ResourceScope.hpp"
#include "engine/TaskFile.hpp"
#include "engine/TaskRegistry.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{

constexpr char kDefaultTaskFile[] = "periodical.json";
constexpr std::size_t kDefaultWorkers = 4;

struct CommandLine
{
    std::filesystem::path task_file{kDefaultTaskFile};
    std::string command;
    std::vector<std::string> arguments;
    bool show_help = false;
    bool show_version = false;
};

void print_usage()
{
    pd::log::print_status(
        "usage: periodical [--tasks FILE] <command> [args]\n"
        "\n"
        "commands:\n"
        "  run                 start every active task and run until signalled\n"
        "  run-once NAME       run one task now; exit status reflects the result\n"
        "  list                show registered tasks and their intervals\n"
        "  overdue NAME SINCE  check whether a task last seen at SINCE (unix\n"
        "                      seconds) has missed more than one cycle\n"
        "\n"
        "environment:\n"
        "  PERIODICAL           name[:seconds],... tasks to activate\n"
        "  PERIODICAL_WORKERS   worker threads for `run` (default {})\n"
        "  PERIODICAL_LOG_FILE  also append log lines to this file",
        kDefaultWorkers);
}

std::optional<CommandLine> parse_command_line(int argc, char *argv[])
{
    CommandLine cli;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            cli.show_help = true;
        }
        else if (arg == "--version")
        {
            cli.show_version = true;
        }
        else if (arg == "--tasks")
        {
            if (i + 1 >= argc)
            {
                PD_LOG_ERROR("--tasks requires a path");
                return std::nullopt;
            }
            cli.task_file = argv[++i];
        }
        else if (cli.command.empty())
        {
            cli.command = std::string(arg);
        }
        else
        {
            cli.arguments.emplace_back(arg);
        }
    }
    return cli;
}

std::optional<long long> parse_integer(std::string_view text)
{
    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

std::size_t worker_count_from_env()
{
    auto const *raw = std::getenv("PERIODICAL_WORKERS");
    if (raw == nullptr)
    {
        return kDefaultWorkers;
    }
    auto parsed = parse_integer(raw);
    if (!parsed || *parsed <= 0)
    {
        throw pd::engine::ConfigError(
            std::string("PERIODICAL_WORKERS must be a positive integer, got '") +
            raw + "'");
    }
    return static_cast<std::size_t>(*parsed);
}

int run_scheduler(pd::engine::TaskRegistry const &registry)
{
    pd::engine::PeriodicRunner::Options options;
    options.workers = worker_count_from_env();
    options.resource =
        std::make_shared<pd::engine::BoundedResourcePool>(options.workers);

    pd::engine::PeriodicRunner runner(registry, options);
    pd::runtime::install_signal_handlers();
    auto const handles = runner.run();
    if (handles.empty())
    {
        PD_LOG_WARN("no active tasks; set PERIODICAL or mark tasks active");
    }
    PD_LOG_INFO("{} running {} task(s) on {} worker(s)",
                pd::version::kDisplayVersion, handles.size(), options.workers);

    pd::runtime::wait_for_shutdown(std::chrono::milliseconds(200));
    PD_LOG_INFO("shutdown requested");
    runner.stop();
    return pd::app::kExitOk;
}

int run_once(pd::engine::TaskRegistry const &registry, std::string const &name)
{
    pd::engine::ManualInvoker invoker(registry);
    try
    {
        invoker.run_once(name);
    }
    catch (pd::engine::UnknownTaskError const &)
    {
        throw;
    }
    catch (std::exception const &ex)
    {
        pd::log::print_status("{} failed: {}", name, ex.what());
        return pd::app::kExitTaskFailed;
    }
    pd::log::print_status("{} succeeded", name);
    return pd::app::kExitOk;
}

int list_tasks(pd::engine::TaskRegistry const &registry)
{
    pd::engine::LivenessQuery liveness(registry);
    for (auto const &config : registry.all())
    {
        auto const interval = liveness.interval(config.name);
        auto const schedule =
            interval ? std::to_string(
                           std::chrono::duration_cast<std::chrono::seconds>(
                               *interval)
                               .count()) +
                           "s"
                     : std::string("inactive");
        pd::log::print_status("{:<24} {:>10}  {}", config.name, schedule,
                              config.description);
    }
    return pd::app::kExitOk;
}

int check_overdue(pd::engine::TaskRegistry const &registry,
                  std::string const &name, std::string const &since_text)
{
    // system_clock cannot represent every 64-bit count of seconds.
    auto const limit = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::duration::max())
                           .count();
    auto const since_seconds = parse_integer(since_text);
    if (!since_seconds || *since_seconds > limit || *since_seconds < -limit)
    {
        PD_LOG_ERROR("SINCE must be unix seconds, got '{}'", since_text);
        return pd::app::kExitUsage;
    }
    pd::engine::LivenessQuery liveness(registry);
    auto const since = std::chrono::system_clock::time_point(
        std::chrono::seconds(*since_seconds));
    bool const overdue = liveness.overdue(name, since);
    pd::log::print_status("{}", overdue ? "overdue" : "ok");
    return overdue ? pd::app::kExitTaskFailed : pd::app::kExitOk;
}

} // namespace

namespace pd::app
{

int daemon_main(int argc, char *argv[])
{
    auto cli = parse_command_line(argc, argv);
    if (!cli)
    {
        print_usage();
        return kExitUsage;
    }
    if (cli->show_version)
    {
        pd::log::print_status("{}", pd::version::kDisplayVersion);
        return kExitOk;
    }
    if (cli->show_help || cli->command.empty())
    {
        print_usage();
        return cli->show_help ? kExitOk : kExitUsage;
    }

    if (auto const *log_file = std::getenv("PERIODICAL_LOG_FILE"))
    {
        pd::log::set_log_file(log_file);
    }

    try
    {
        pd::engine::TaskRegistry registry(pd::engine::process_env_overrides());
        auto const definitions = pd::engine::load_task_file(cli->task_file);
        auto const count =
            pd::engine::register_task_definitions(registry, definitions);
        PD_LOG_DEBUG("registered {} task(s) from {}", count,
                     cli->task_file.string());

        auto const &args = cli->arguments;
        if (cli->command == "run" && args.empty())
        {
            return run_scheduler(registry);
        }
        if (cli->command == "run-once" && args.size() == 1)
        {
            return run_once(registry, args[0]);
        }
        if (cli->command == "list" && args.empty())
        {
            return list_tasks(registry);
        }
        if (cli->command == "overdue" && args.size() == 2)
        {
            return check_overdue(registry, args[0], args[1]);
        }
    }
    catch (pd::engine::ConfigError const &ex)
    {
        PD_LOG_ERROR("configuration error: {}", ex.what());
        return kExitUsage;
    }
    catch (pd::engine::UnknownTaskError const &ex)
    {
        PD_LOG_ERROR("no task named '{}' in {}", ex.name(),
                     cli->task_file.string());
        return kExitUsage;
    }

    PD_LOG_ERROR("unknown command or wrong arguments: {}", cli->command);
    print_usage();
    return kExitUsage;
}

} // namespace pd::app
