#include "time.hpp"

namespace farmer::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ElapsedMillis(TimePoint since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

} // namespace farmer::util
