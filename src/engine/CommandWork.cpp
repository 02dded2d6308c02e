#include "engine/CommandWork.hpp"

#include "engine/Errors.hpp"
#include "engine/TimedExecution.hpp"
#include "utils/Log.hpp"
#include "utils/Subprocess.hpp"

#include <format>
#include <utility>

namespace pd::engine
{

CommandWork::CommandWork(std::string command) : command_(std::move(command))
{
}

void CommandWork::execute()
{
    PD_LOG_DEBUG("exec: {}", command_);
    auto const result = utils::run_shell_command(
        command_, [] { return cancellation_requested(); });
    if (result.cancelled)
    {
        throw CommandFailedError(
            std::format("command cancelled: {}", command_), result.exit_code);
    }
    if (result.term_signal != 0)
    {
        throw CommandFailedError(std::format("command killed by signal {}: {}",
                                             result.term_signal, command_),
                                 result.exit_code);
    }
    if (result.exit_code != 0)
    {
        throw CommandFailedError(std::format("command exited with status {}: {}",
                                             result.exit_code, command_),
                                 result.exit_code);
    }
}

} // namespace pd::engine
