#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace jobclaim::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);
uint64_t  NowMillis();

// RFC3339 UTC, millisecond precision: 2026-01-14T10:00:00.000Z
std::string ToRfc3339(TimePoint tp);

// Human readable age: 42s, 7m, 3h, 2d
std::string FormatAge(uint64_t age_ms);

} // namespace jobclaim::util
