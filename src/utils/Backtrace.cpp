#include "utils/Backtrace.hpp"

#include <array>
#include <cstdlib>

#if defined(__GLIBC__)
#include <execinfo.h>
#endif

namespace pd::utils
{

std::vector<std::string> capture_backtrace(int skip)
{
    std::vector<std::string> frames;
#if defined(__GLIBC__)
    std::array<void *, 64> addresses{};
    int const depth =
        ::backtrace(addresses.data(), static_cast<int>(addresses.size()));
    // +1 hides capture_backtrace itself
    int const first = skip + 1;
    if (depth <= first)
    {
        return frames;
    }
    char **symbols = ::backtrace_symbols(addresses.data(), depth);
    if (symbols == nullptr)
    {
        return frames;
    }
    frames.reserve(static_cast<std::size_t>(depth - first));
    for (int i = first; i < depth; ++i)
    {
        frames.emplace_back(symbols[i] ? symbols[i] : "??");
    }
    std::free(symbols);
#else
    (void)skip;
#endif
    return frames;
}

} // namespace pd::utils
