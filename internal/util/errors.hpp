#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace farmer::util {

/*
  Central error types.

  Retryable errors never leave the piece provider; everything else
  aborts the operation that raised it.
*/

class RetryableNetworkError : public std::runtime_error {
 public:
  explicit RetryableNetworkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Permanent: raised once the shared cancellation flag is observed set.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Protocol-consistency violation.

  Pieces reaching the plotter are validated upstream, so a piece that
  cannot be decoded means the node or this process is broken. Logs at
  critical level and aborts; callers must not try to recover.
*/
[[noreturn]] void AbortOnProtocolViolation(std::string_view what);

} // namespace farmer::util
