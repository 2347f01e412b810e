#include "errors.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

namespace farmer::util {

void AbortOnProtocolViolation(std::string_view what) {
  spdlog::critical("protocol violation: {}", what);
  spdlog::shutdown();
  std::abort();
}

} // namespace farmer::util
