#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace entitystore::util {

/*
  Time utilities: the single place that reads the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// ISO-8601 UTC with microseconds, e.g. 2025-03-01T10:15:30.000120+00:00
std::string ToIsoString(TimePoint tp);

// Accepts the ToIsoString form, a trailing 'Z', or no offset at all.
// Throws std::invalid_argument on malformed input.
TimePoint FromIsoString(const std::string& text);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace entitystore::util
