#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define IMC_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define IMC_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otel_export.hpp"

namespace imc::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value>
void RecordPlain(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value) {
  if constexpr (requires { instrument->Record(value, opentelemetry::context::Context{}); }) {
    instrument->Record(value, opentelemetry::context::Context{});
  } else {
    instrument->Record(value);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reconcile_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      reconcile_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dropped_keys;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> watch_reconnects;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   active_watches_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;

  std::atomic<std::int64_t> active_watches{0};
};

bool InitializeMetrics(const imc::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto target = otel::ResolveExportTarget(config, otel::Signal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = target.endpoint;
    options.use_ssl_credentials = !target.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(configured_interval_ms);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

#ifdef IMC_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = otel::ControllerResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter(otel::kInstrumentationName, otel::kInstrumentationVersion);

  impl_->reconcile_count      = impl_->meter->CreateUInt64Counter("imc.reconcile.count", "1", "Instance manager reconciliations by result");
  impl_->reconcile_latency_ms = impl_->meter->CreateDoubleHistogram("imc.reconcile.latency_ms", "ms", "Reconciliation latency in milliseconds");
  impl_->dropped_keys         = impl_->meter->CreateUInt64Counter("imc.queue.dropped", "1", "Keys dropped after exhausting retries");
  impl_->watch_reconnects     = impl_->meter->CreateUInt64Counter("imc.watch.reconnects", "1", "Process watch stream reopen attempts");
  impl_->request_count        = impl_->meter->CreateUInt64Counter("imc.admin.requests", "1", "Admin RPC requests by route and outcome");
  impl_->request_latency_ms   = impl_->meter->CreateDoubleHistogram("imc.admin.latency_ms", "ms", "Admin RPC latency in milliseconds");
  impl_->active_watches_gauge = impl_->meter->CreateInt64ObservableGauge("imc.watch.active", "Currently registered process watches", "1");
  impl_->active_watches_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->active_watches.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordReconcile(std::string_view result) {
  if (!impl_ || !impl_->reconcile_count) {
    return;
  }

  const std::string                          value(result);
  const std::initializer_list<AttributePair> attributes = {{"result", value}};
  AddWithAttributes(impl_->reconcile_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveReconcileLatencyMs(double latency_ms) {
  if (!impl_ || !impl_->reconcile_latency_ms) {
    return;
  }
  RecordPlain(impl_->reconcile_latency_ms, latency_ms);
}

void Metrics::RecordDroppedKey() {
  if (!impl_ || !impl_->dropped_keys) {
    return;
  }
  AddWithAttributes(impl_->dropped_keys, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordWatchReconnect(std::string_view role) {
  if (!impl_ || !impl_->watch_reconnects) {
    return;
  }

  const std::string                          value(role);
  const std::initializer_list<AttributePair> attributes = {{"role", value}};
  AddWithAttributes(impl_->watch_reconnects, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRequest(std::string_view route, bool ok) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::string                          route_value(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_value}, {"ok", ok}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::string                          route_value(route);
  const std::initializer_list<AttributePair> attributes = {{"route", route_value}};
  if constexpr (requires { impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{}); }) {
    impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
  } else {
    impl_->request_latency_ms->Record(latency_ms, attributes);
  }
}

void Metrics::SetActiveWatches(std::uint64_t count) {
  if (!impl_) {
    return;
  }
  impl_->active_watches.store(static_cast<std::int64_t>(count));
}

} // namespace imc::observability

#endif
