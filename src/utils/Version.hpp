#pragma once

#ifndef PD_BUILD_VERSION
#define PD_BUILD_VERSION "0.0.0-dev"
#endif

namespace pd::version
{

inline constexpr char const kDisplayVersion[] = "periodical " PD_BUILD_VERSION;

} // namespace pd::version
