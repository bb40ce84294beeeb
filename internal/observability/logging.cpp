#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace imc::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] [%t] %v";

std::atomic<bool> g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

// spdlog maps unknown names to "off"; a typo must not silence the controller.
spdlog::level::level_enum ParseLevel(const std::string& name, bool* recognized) {
  const auto level = spdlog::level::from_str(name);
  *recognized      = level != spdlog::level::off || name == "off";
  return *recognized ? level : spdlog::level::info;
}

bool TraceContextEnabled(const imc::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("IMC_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return config.logging().include_trace_context();
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') return true;
  }
  return false;
}

void AppendField(std::string& line, const LogField& field) {
  line.push_back(' ');
  line.append(field.key);
  line.push_back('=');
  if (!NeedsQuoting(field.value)) {
    line.append(field.value);
    return;
  }
  line.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') line.push_back('\\');
    if (c == '\n') {
      line.append("\\n");
      continue;
    }
    line.push_back(c);
  }
  line.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& line, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    line.push_back(kHex[(data[i] >> 4) & 0x0F]);
    line.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line.append(" trace_id=");
  AppendHex(line, trace_bytes, 16);
  line.append(" span_id=");
  AppendHex(line, span_bytes, 8);
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

void InitializeLogging(const imc::runtime::config::RuntimeConfig& config) {
  std::string name = "imc-controller";
  if (!config.controller().controller_id().empty()) {
    name += "/" + config.controller().controller_id();
  }

  const auto level_name = EnvOr("IMC_LOG_LEVEL", config.logging().level(), "info");
  bool       recognized = true;
  const auto level      = ParseLevel(level_name, &recognized);

  spdlog::drop(name);
  auto logger = spdlog::stdout_color_mt(name);
  logger->set_pattern(EnvOr("IMC_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context.store(TraceContextEnabled(config), std::memory_order_relaxed);

  if (!recognized) {
    LogWarn("Unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace imc::observability
