#include "internal/observability/otel_export.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace imc::observability::otel {
namespace resource = opentelemetry::sdk::resource;

ExportTarget ResolveExportTarget(const imc::runtime::config::RuntimeConfig& config, Signal signal) {
  const auto& observability = config.observability();

  ExportTarget target;
  target.http = observability.transport() == imc::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    target.endpoint = observability.otlp_endpoint();
    return target;
  }

  const char* signal_env = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env)) {
    target.endpoint = endpoint;
    return target;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
    return target;
  }

  if (!target.http) {
    target.endpoint = "localhost:4317";
  } else {
    target.endpoint = signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  }
  return target;
}

resource::Resource ControllerResource(const imc::runtime::config::RuntimeConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", kInstrumentationName}};
  if (!config.controller().controller_id().empty()) {
    const opentelemetry::nostd::string_view controller_id(config.controller().controller_id());
    attrs.SetAttribute("service.instance.id", controller_id);
    attrs.SetAttribute("imc.controller.node", controller_id);
  }
  if (!config.controller().namespace_().empty()) {
    attrs.SetAttribute("imc.controller.namespace", opentelemetry::nostd::string_view(config.controller().namespace_()));
  }
  return resource::Resource::Create(attrs);
}

} // namespace imc::observability::otel

#endif
