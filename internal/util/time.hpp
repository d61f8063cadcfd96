#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace schemaflow::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// UTC, millisecond precision: 2025-10-01T15:20:46.561Z
std::string FormatIso8601(TimePoint tp);

} // namespace schemaflow::util
