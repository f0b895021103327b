#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using deliveryiq::observability::FormatLogLine;
using deliveryiq::observability::IntField;
using deliveryiq::observability::StringField;

void TestPlainFields() {
  assert(FormatLogLine("curve recompute finished", {}) == "curve recompute finished");
  assert(FormatLogLine("segments discovered", {IntField("segments", 32), StringField("backend", "sqlite")}) ==
         "segments discovered segments=32 backend=sqlite");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatLogLine("curve computed", {StringField("segment", "UPS/UPS Ground/ground/zone_4/normal")}) ==
         "curve computed segment=\"UPS/UPS Ground/ground/zone_4/normal\"");
  assert(FormatLogLine("sync page failed", {StringField("error", "constraint \"pk\" failed")}) ==
         "sync page failed error=\"constraint \\\"pk\\\" failed\"");
  assert(FormatLogLine("x", {StringField("k", "a=b")}) == "x k=\"a=b\"");
  assert(FormatLogLine("x", {StringField("k", "")}) == "x k=\"\"");
}

void TestInitializeFromConfigAndEnvironment() {
  deliveryiq::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  config.mutable_logging()->set_pattern("%v");

  unsetenv("DELIVERYIQ_LOG_LEVEL");
  deliveryiq::observability::InitializeLogging(config);
  assert(spdlog::get_level() == spdlog::level::warn);

  setenv("DELIVERYIQ_LOG_LEVEL", "debug", 1);
  deliveryiq::observability::InitializeLogging(config);
  assert(spdlog::get_level() == spdlog::level::debug);
  unsetenv("DELIVERYIQ_LOG_LEVEL");

  // re-initializing replaces the logger instead of failing on the duplicate name
  deliveryiq::observability::InitializeLogging(deliveryiq::runtime::config::RuntimeConfig{});
  assert(spdlog::get_level() == spdlog::level::info);
  DELIVERYIQ_LOG_INFO("logging ready", {StringField("component", "test")});
}

} // namespace

int main() {
  TestPlainFields();
  TestValuesWithSpacesAreQuoted();
  TestInitializeFromConfigAndEnvironment();

  deliveryiq::observability::ShutdownLogging();
  std::cout << "deliveryiq_unit_logging: pass\n";
  return 0;
}
