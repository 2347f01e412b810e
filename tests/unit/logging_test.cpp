#include "internal/observability/logging.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"

namespace {

void TestConfigLevelIsApplied() {
  unsetenv("FARMER_LOG_LEVEL");
  unsetenv("FARMER_LOG_PATTERN");

  farmer::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  farmer::observability::InitializeLogging(config);

  auto logger = spdlog::default_logger();
  assert(logger->name() == "farmer");
  assert(logger->level() == spdlog::level::debug);

  FARMER_LOG_DEBUG("logging initialized", {farmer::observability::UintField("attempt", 1)});
}

void TestReinitializeReplacesLogger() {
  farmer::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  farmer::observability::InitializeLogging(config);

  assert(spdlog::default_logger()->level() == spdlog::level::warn);
}

void TestEnvironmentOverridesConfig() {
  setenv("FARMER_LOG_LEVEL", "error", 1);

  farmer::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("trace");
  farmer::observability::InitializeLogging(config);

  assert(spdlog::default_logger()->level() == spdlog::level::err);
  unsetenv("FARMER_LOG_LEVEL");
}

void TestFieldFormatting() {
  using namespace farmer::observability;

  const auto string_field = StringField("storage", "cache");
  assert(string_field.key == "storage" && string_field.value == "cache");
  assert(IntField("elapsed_ms", -3).value == "-3");
  assert(UintField("piece_index", 18446744073709551615ULL).value == "18446744073709551615");
  assert(BoolField("validated", false).value == "false");
}

} // namespace

int main() {
  TestConfigLevelIsApplied();
  TestReinitializeReplacesLogger();
  TestEnvironmentOverridesConfig();
  TestFieldFormatting();
  farmer::observability::ShutdownLogging();

  std::cout << "farmer_unit_logging: pass\n";
  return 0;
}
