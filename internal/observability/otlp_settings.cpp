#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace opentimeline::observability {

OtlpSettings ResolveOtlpSettings(const opentimeline::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  OtlpSettings settings;
  settings.http = config.transport() == opentimeline::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
    return settings;
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env)) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else if (settings.http) {
    settings.endpoint = signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    settings.endpoint = "localhost:4317";
  }
  return settings;
}

} // namespace opentimeline::observability
