#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ferry::util {

/*
  Time utilities. Single place to control the clock source.
*/

using SteadyClock = std::chrono::steady_clock;

// Milliseconds elapsed since `start` on the steady clock.
int64_t ElapsedMillis(SteadyClock::time_point start);

// Microseconds since the Unix epoch -> "YYYY-MM-DD HH:MM:SS.ffffff" (UTC).
std::string FormatMicros(int64_t micros_since_epoch);

} // namespace ferry::util
