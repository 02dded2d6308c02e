#pragma once

#include <string>
#include <vector>

namespace pd::utils
{

// Symbolized frames of the calling thread, innermost first. `skip` drops
// that many frames above the caller. Empty when the platform has no
// backtrace facility.
std::vector<std::string> capture_backtrace(int skip = 0);

} // namespace pd::utils
