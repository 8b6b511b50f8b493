#pragma once

#include <chrono>
#include <cstdint>

namespace fmd::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
int64_t ToUnixSeconds(TimePoint tp);

int64_t NowMillis();

} // namespace fmd::util
