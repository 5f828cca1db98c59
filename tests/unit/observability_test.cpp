#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/otlp_settings.hpp"
#include "internal/observability/tracing.hpp"

namespace {

namespace observability = opentimeline::observability;
using opentimeline::runtime::config::ObservabilityConfig;

void TestFieldsAreQuotedOnlyWhenNeeded() {
  const auto line = observability::FormatFields({observability::StringField("timeline_id", "ww1"), observability::CountField("entities", 4),
                                                 observability::StringField("error", "unexpected \"x\" at 3")});
  assert(line == R"(timeline_id=ww1 entities=4 error="unexpected \"x\" at 3")");

  assert(observability::FormatFields({}).empty());
  assert(observability::FormatFields({observability::StringField("timeline", "")}) == R"(timeline="")");
  assert(observability::FormatFields({observability::StringField("expr", "era=ww1")}) == R"(expr="era=ww1")");
}

void TestCyclePathField() {
  const std::vector<std::string> cycle{"a", "b", "a"};
  assert(observability::FormatFields({observability::PathField("path", cycle)}) == R"(path="a -> b -> a")");
  assert(observability::FormatFields({observability::PathField("path", {"solo"})}) == "path=solo");
}

void TestParseLogLevel() {
  assert(observability::ParseLogLevel("debug") == spdlog::level::debug);
  assert(observability::ParseLogLevel("warning") == spdlog::level::warn);
  assert(observability::ParseLogLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    (void)observability::ParseLogLevel("loud");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestLogLineCarriesFields() {
  std::ostringstream out;
  auto               sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto               logger = std::make_shared<spdlog::logger>("observability_test", sink);
  logger->set_pattern("%l %v");
  logger->set_level(spdlog::level::info);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(logger);

  OPENTIMELINE_LOG_WARN("skipping dangling link", {observability::StringField("timeline_id", "T"), observability::StringField("entity_id", "gone")});
  OPENTIMELINE_LOG_INFO("no fields");
  logger->flush();
  spdlog::set_default_logger(previous);

  assert(out.str() == "warning skipping dangling link timeline_id=T entity_id=gone\ninfo no fields\n");
}

void TestOtlpEndpointResolution() {
  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");

  ObservabilityConfig config;
  auto                settings = observability::ResolveOtlpSettings(config, observability::OtlpSignal::kTraces);
  assert(!settings.http);
  assert(settings.endpoint == "localhost:4317");

  config.set_transport(opentimeline::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(observability::ResolveOtlpSettings(config, observability::OtlpSignal::kMetrics).endpoint == "http://localhost:4318/v1/metrics");

  ::setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318", 1);
  assert(observability::ResolveOtlpSettings(config, observability::OtlpSignal::kTraces).endpoint == "http://collector:4318");
  ::setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "http://traces:4318/v1/traces", 1);
  assert(observability::ResolveOtlpSettings(config, observability::OtlpSignal::kTraces).endpoint == "http://traces:4318/v1/traces");
  assert(observability::ResolveOtlpSettings(config, observability::OtlpSignal::kMetrics).endpoint == "http://collector:4318");

  config.set_otlp_endpoint("http://configured:4318");
  assert(observability::ResolveOtlpSettings(config, observability::OtlpSignal::kTraces).endpoint == "http://configured:4318");

  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
}

void TestTelemetryIsSafeWithoutExporters() {
  opentimeline::runtime::config::RuntimeConfig config;
  assert(!observability::InitializeTracing(config));
  assert(!observability::InitializeMetrics(config));

  {
    observability::SpanScope span("TimelineService.RenderTimeline");
    span.SetAttribute("timeline.ref", "ww1");
    span.RecordError("cycle", "subtimeline cycle: a -> b -> a");
  }
  observability::Metrics::Instance().RecordRpc("TimelineService.RenderTimeline", "ok", 1.5);
  observability::Metrics::Instance().RecordRender(4, 2);

  observability::ShutdownMetrics();
  observability::ShutdownTracing();
}

} // namespace

int main() {
  TestFieldsAreQuotedOnlyWhenNeeded();
  TestCyclePathField();
  TestParseLogLevel();
  TestLogLineCarriesFields();
  TestOtlpEndpointResolution();
  TestTelemetryIsSafeWithoutExporters();

  std::cout << "opentimeline_unit_observability: pass\n";
  return 0;
}
