#include "backoff.hpp"

#include <algorithm>
#include <random>
#include <utility>

namespace farmer::dsn {

ExponentialBackoff::ExponentialBackoff(BackoffOptions options)
    : options_(std::move(options)), current_interval_(options_.initial_interval), started_at_(farmer::util::Now()) {
}

void ExponentialBackoff::Reset() {
  current_interval_ = options_.initial_interval;
  started_at_       = farmer::util::Now();
}

std::optional<std::chrono::milliseconds> ExponentialBackoff::NextBackoff() {
  if (options_.max_elapsed_time && farmer::util::ElapsedMillis(started_at_) >= options_.max_elapsed_time->count()) {
    return std::nullopt;
  }

  static thread_local std::mt19937_64 rng{std::random_device{}()};

  const double interval = static_cast<double>(current_interval_.count());
  const double delta    = options_.randomization_factor * interval;
  double       delay    = interval;
  if (delta > 0) {
    std::uniform_real_distribution<double> dist(interval - delta, interval + delta);
    delay = dist(rng);
  }

  const double next = std::min(interval * options_.multiplier, static_cast<double>(options_.max_interval.count()));
  current_interval_ = std::chrono::milliseconds(static_cast<int64_t>(next));

  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace farmer::dsn
