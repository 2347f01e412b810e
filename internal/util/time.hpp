#pragma once

#include <chrono>
#include <cstdint>

namespace farmer::util {

/*
  Monotonic clock helpers for retrieval timeouts and timing logs.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ElapsedMillis(TimePoint since);

} // namespace farmer::util
