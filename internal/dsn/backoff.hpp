#pragma once

#include <chrono>
#include <optional>

#include "internal/util/time.hpp"

namespace farmer::dsn {

struct BackoffOptions {
  std::chrono::milliseconds initial_interval{1000};
  std::chrono::milliseconds max_interval{5000};
  double                    multiplier           = 1.5;
  double                    randomization_factor = 0.5;
  // Unset: never give up.
  std::optional<std::chrono::milliseconds> max_elapsed_time;
};

/*
  Randomized exponential backoff.

  Each delay is the current interval scaled by a random factor in
  [1 - randomization_factor, 1 + randomization_factor]; the interval then
  grows by `multiplier` up to `max_interval`.
*/
class ExponentialBackoff {
 public:
  explicit ExponentialBackoff(BackoffOptions options);

  // Delay before the next attempt, or std::nullopt once max_elapsed_time has passed.
  std::optional<std::chrono::milliseconds> NextBackoff();

  void Reset();

 private:
  BackoffOptions            options_;
  std::chrono::milliseconds current_interval_;
  farmer::util::TimePoint   started_at_;
};

} // namespace farmer::dsn
