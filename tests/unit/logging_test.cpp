#include "internal/observability/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "config/config.pb.h"

namespace {

using imc::observability::IntField;
using imc::observability::StringField;

// Routes the default logger into `out` with a bare message pattern.
std::shared_ptr<spdlog::logger> CaptureInto(std::ostringstream& out, spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  sink->set_pattern("%v");
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  return logger;
}

void TestErrorValuesAreQuoted() {
  std::ostringstream out;
  CaptureInto(out, spdlog::level::debug);

  IMC_LOG_WARN("Error syncing instance manager",
               {StringField("key", "imc-system/im-1"),
                StringField("error", "fail to sync instance manager for imc-system/im-1: connection refused")});

  assert(out.str() ==
         "Error syncing instance manager key=imc-system/im-1 "
         "error=\"fail to sync instance manager for imc-system/im-1: connection refused\"\n");
}

void TestQuotesAndEmptyValuesStayParseable() {
  std::ostringstream out;
  CaptureInto(out, spdlog::level::debug);

  IMC_LOG_INFO("Created instance manager pod",
               {StringField("pod", "im-1"), StringField("ip", ""), StringField("reason", "said \"no\""), IntField("port", 8500)});

  assert(out.str() == "Created instance manager pod pod=im-1 ip=\"\" reason=\"said \\\"no\\\"\" port=8500\n");
}

void TestMessagesBelowLevelAreDropped() {
  std::ostringstream out;
  CaptureInto(out, spdlog::level::warn);

  IMC_LOG_DEBUG("Merged process event", {StringField("instance", "e-1")});
  IMC_LOG_INFO("Started process watch");
  assert(out.str().empty());

  IMC_LOG_ERROR("Dropping instance manager out of the queue");
  assert(out.str() == "Dropping instance manager out of the queue\n");
}

void TestLoggerIsNamedAfterController() {
  unsetenv("IMC_LOG_LEVEL");
  unsetenv("IMC_LOG_PATTERN");

  imc::runtime::config::RuntimeConfig config;
  config.mutable_controller()->set_controller_id("node-1");
  config.mutable_logging()->set_level("debug");

  imc::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->name() == "imc-controller/node-1");
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  // Reinitializing replaces the registered logger instead of throwing.
  config.mutable_logging()->set_level("warn");
  imc::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::warn);
}

void TestUnknownLevelFallsBackToInfo() {
  unsetenv("IMC_LOG_LEVEL");

  imc::runtime::config::RuntimeConfig config;
  config.mutable_controller()->set_controller_id("node-2");
  config.mutable_logging()->set_level("verbose");

  imc::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  config.mutable_logging()->set_level("off");
  imc::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::off);
}

} // namespace

int main() {
  TestErrorValuesAreQuoted();
  TestQuotesAndEmptyValuesStayParseable();
  TestMessagesBelowLevelAreDropped();
  TestLoggerIsNamedAfterController();
  TestUnknownLevelFallsBackToInfo();

  imc::observability::ShutdownLogging();
  std::cout << "imc_unit_logging: pass\n";
  return 0;
}
