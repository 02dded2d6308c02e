#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <vector>

namespace pd::engine
{

enum class RunStatus
{
    Succeeded,
    Failed,
    TimedOut,
};

char const *to_string(RunStatus status) noexcept;

// How a single execution of a work unit settled.
struct RunOutcome
{
    RunStatus status = RunStatus::Succeeded;
    std::exception_ptr error;
    std::string message;
    std::vector<std::string> backtrace;

    bool ok() const noexcept { return status == RunStatus::Succeeded; }

    static RunOutcome success();
    static RunOutcome failure(std::exception_ptr error,
                              std::vector<std::string> backtrace = {});
    // Synthesizes a TaskTimeoutError for `task`.
    static RunOutcome timeout(std::string const &task,
                              std::chrono::milliseconds limit);
};

// what() of the stored exception, or a placeholder for non-std exceptions.
std::string describe_exception(std::exception_ptr const &error);

} // namespace pd::engine
