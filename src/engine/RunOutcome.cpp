#include "engine/RunOutcome.hpp"

#include "engine/Errors.hpp"
#include "utils/Backtrace.hpp"

#include <utility>

namespace pd::engine
{

char const *to_string(RunStatus status) noexcept
{
    switch (status)
    {
    case RunStatus::Succeeded:
        return "success";
    case RunStatus::Failed:
        return "exception";
    case RunStatus::TimedOut:
        return "timeout";
    }
    return "exception";
}

RunOutcome RunOutcome::success()
{
    return {};
}

RunOutcome RunOutcome::failure(std::exception_ptr error,
                               std::vector<std::string> backtrace)
{
    RunOutcome outcome;
    outcome.status = RunStatus::Failed;
    outcome.message = describe_exception(error);
    outcome.error = std::move(error);
    outcome.backtrace = std::move(backtrace);
    return outcome;
}

RunOutcome RunOutcome::timeout(std::string const &task,
                               std::chrono::milliseconds limit)
{
    RunOutcome outcome;
    outcome.status = RunStatus::TimedOut;
    outcome.error = std::make_exception_ptr(TaskTimeoutError(task, limit));
    outcome.message = describe_exception(outcome.error);
    outcome.backtrace = utils::capture_backtrace(1);
    return outcome;
}

std::string describe_exception(std::exception_ptr const &error)
{
    if (!error)
    {
        return {};
    }
    try
    {
        std::rethrow_exception(error);
    }
    catch (std::exception const &ex)
    {
        return ex.what();
    }
    catch (...)
    {
        return "non-standard exception";
    }
}

} // namespace pd::engine
