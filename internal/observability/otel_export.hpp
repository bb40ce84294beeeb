#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

namespace imc::runtime::config {
class RuntimeConfig;
}

namespace imc::observability::otel {

inline constexpr const char* kInstrumentationName    = "imc-controller";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

enum class Signal {
  kTraces,
  kMetrics,
};

struct ExportTarget {
  std::string endpoint;
  bool        http{false};
  bool        insecure{true};
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the transport's local default.
ExportTarget ResolveExportTarget(const imc::runtime::config::RuntimeConfig& config, Signal signal);

// Every controller in the cluster exports under the same service name, so the
// resource also carries the controller id and namespace it reconciles.
opentelemetry::sdk::resource::Resource ControllerResource(const imc::runtime::config::RuntimeConfig& config);

} // namespace imc::observability::otel

#endif
