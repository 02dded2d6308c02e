#pragma once

#include <chrono>

namespace pd::runtime
{

// Async-signal-safe; may be called from a signal handler.
void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// Blocks the caller until request_shutdown() has been observed, checking
// every `poll` interval.
void wait_for_shutdown(std::chrono::milliseconds poll);

void install_signal_handlers();

} // namespace pd::runtime
