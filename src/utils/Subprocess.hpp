#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace pd::utils
{

struct ProcessResult
{
    int exit_code = 0;
    // Set when the child was terminated by a signal; exit_code is then -1.
    int term_signal = 0;
    bool cancelled = false;
};

// Runs `/bin/sh -c command` in its own process group and waits for it.
// `should_cancel` is polled while the child runs; once it returns true the
// group is sent SIGTERM, then SIGKILL if the shell outlives `kill_grace`.
// Throws std::system_error when the child cannot be spawned.
ProcessResult run_shell_command(std::string const &command,
                                std::function<bool()> const &should_cancel,
                                std::chrono::milliseconds poll =
                                    std::chrono::milliseconds(20),
                                std::chrono::milliseconds kill_grace =
                                    std::chrono::milliseconds(500));

} // namespace pd::utils
