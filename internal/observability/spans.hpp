#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace imc::runtime::config {
class RuntimeConfig;
}

namespace imc::observability {

// Attribute keys shared by reconcile, process watch and admin spans.
namespace span_attr {
inline constexpr const char* kKey             = "imc.key";
inline constexpr const char* kInstanceManager = "imc.instance_manager";
inline constexpr const char* kOwnership       = "imc.ownership";
inline constexpr const char* kRole            = "imc.role";
inline constexpr const char* kInstance        = "imc.instance";
inline constexpr const char* kMergeOutcome    = "imc.merge.outcome";
inline constexpr const char* kWriteOutcome    = "imc.write.outcome";
} // namespace span_attr

bool InitializeTracing(const imc::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const imc::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  // Adds an "imc.state_transition" event carrying the old and new state names.
  void RecordTransition(std::string_view from, std::string_view to);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // result is one of "success", "requeue", "error".
  void RecordReconcile(std::string_view result);
  void ObserveReconcileLatencyMs(double latency_ms);
  void RecordDroppedKey();
  void RecordWatchReconnect(std::string_view role);
  void SetActiveWatches(std::uint64_t count);

  void RecordRequest(std::string_view route, bool ok);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const imc::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const imc::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordTransition(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordReconcile(std::string_view) {
}

inline void Metrics::ObserveReconcileLatencyMs(double) {
}

inline void Metrics::RecordDroppedKey() {
}

inline void Metrics::RecordWatchReconnect(std::string_view) {
}

inline void Metrics::SetActiveWatches(std::uint64_t) {
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}
#endif

} // namespace imc::observability
