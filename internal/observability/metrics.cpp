#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdint>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace opentimeline::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

constexpr std::uint32_t kDefaultExportIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const opentimeline::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(
      MakeExporter(ResolveOtlpSettings(observability, OtlpSignal::kMetrics)), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", "opentimeline-server"}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

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

struct Metrics::Impl {
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>>   rpc_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>        rpc_latency_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<std::uint64_t>> render_entities;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<std::uint64_t>> render_timelines;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("opentimeline", "0.1.0");

  impl_->rpc_count        = meter->CreateUInt64Counter("opentimeline.rpc.count", "RPCs by route and outcome", "1");
  impl_->rpc_latency_ms   = meter->CreateDoubleHistogram("opentimeline.rpc.latency_ms", "RPC latency", "ms");
  impl_->render_entities  = meter->CreateUInt64Histogram("opentimeline.render.entities", "Entities per rendered timeline", "1");
  impl_->render_timelines = meter->CreateUInt64Histogram("opentimeline.render.timelines", "Contributing timelines per render", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, std::string_view outcome, double latency_ms) {
  const Attributes attributes = {{"route", opentelemetry::nostd::string_view(route.data(), route.size())},
                                 {"outcome", opentelemetry::nostd::string_view(outcome.data(), outcome.size())}};

  impl_->rpc_count->Add(1, attributes);
  impl_->rpc_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordRender(std::size_t entities, std::size_t contributing_timelines) {
  impl_->render_entities->Record(static_cast<std::uint64_t>(entities), opentelemetry::context::Context{});
  impl_->render_timelines->Record(static_cast<std::uint64_t>(contributing_timelines), opentelemetry::context::Context{});
}

} // namespace opentimeline::observability

#endif
