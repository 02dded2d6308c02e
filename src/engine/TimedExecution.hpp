#pragma once

#include "engine/ResourceScope.hpp"
#include "engine/RunOutcome.hpp"
#include "engine/TaskConfig.hpp"

#include <chrono>
#include <memory>

namespace pd::engine
{

// True inside a work unit whose run has exceeded its timeout. Long-running
// work units should poll this and return early; those that do not are
// abandoned and their eventual result is discarded.
bool cancellation_requested() noexcept;

// How long a timed-out run is given to notice cancellation and return before
// it is abandoned.
inline constexpr std::chrono::milliseconds kCancellationGrace{1000};

// Runs config.work on a dedicated thread with a checkout of `scope` held
// around the call, and waits at most config.timeout_interval for it. On
// timeout the run is cancelled and given kCancellationGrace to return. The
// checkout is released when the work unit returns, whichever way it returns;
// a checkout granted after cancellation skips the work unit.
RunOutcome execute_with_timeout(TaskConfig const &config,
                                std::shared_ptr<ResourceScope> scope = nullptr);

} // namespace pd::engine
