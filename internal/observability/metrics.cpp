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

#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define ARTIFACT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ARTIFACT_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "internal/observability/otlp_settings.hpp"

namespace artifact::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// the metrics SDK moved these entry points between releases

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.use_tls;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const artifact::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveOtlpSettings(config, OtlpSignal::kMetrics);
  if (!settings.enabled) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = settings.export_interval;
#ifdef ARTIFACT_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeExporter(settings), reader_options);
#endif

  resource::ResourceAttributes attributes = {{"service.name", std::string(kServiceName)}, {"service.version", std::string(kServiceVersion)}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attributes));
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

/*
  Instruments bind to whatever provider is global on first use, so the
  daemon initializes metrics before serving the first request.
*/
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> deletions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> batch_chunks;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName, kServiceVersion);

  impl_->requests           = meter->CreateUInt64Counter("artifact.maintenance.requests", "Maintenance RPCs by route and outcome", "1");
  impl_->request_latency_ms = meter->CreateDoubleHistogram("artifact.maintenance.request.latency_ms", "Maintenance RPC latency", "ms");
  impl_->deletions          = meter->CreateUInt64Counter("artifact.maintenance.deletions", "Removed entities by kind", "1");
  impl_->batch_chunks       = meter->CreateUInt64Counter("artifact.maintenance.batch.chunks", "Batch chunks by outcome", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success, double latency_ms) {
  Add(impl_->requests, static_cast<std::uint64_t>(1), {{"route", std::string(route)}, {"success", success}});
  Record(impl_->request_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::RecordDeletions(std::string_view kind, std::uint64_t count) {
  if (count == 0) {
    return;
  }
  Add(impl_->deletions, count, {{"kind", std::string(kind)}});
}

void Metrics::RecordBatchChunk(bool committed) {
  Add(impl_->batch_chunks, static_cast<std::uint64_t>(1), {{"outcome", committed ? "committed" : "aborted"}});
}

} // namespace artifact::observability

#endif
