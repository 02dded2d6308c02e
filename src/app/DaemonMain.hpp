#pragma once

namespace pd::app
{

// Exit codes of the periodical executable.
inline constexpr int kExitOk = 0;
inline constexpr int kExitTaskFailed = 1;
inline constexpr int kExitUsage = 2;

// Entry point shared by main() and the smoke tests.
int daemon_main(int argc, char *argv[]);

} // namespace pd::app
