#pragma once

#include <chrono>
#include <string>

namespace imc::util {

// Single place to control the clock source.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// RFC3339 in UTC with second precision, the format used for resource timestamps.
std::string ToRFC3339(TimePoint tp);
std::string NowRFC3339();

} // namespace imc::util
