#pragma once

#include <string>

namespace opentimeline::runtime::config {
class ObservabilityConfig;
}

namespace opentimeline::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpSettings {
  std::string endpoint;
  bool        http = false;
};

/*
  Exporter endpoint for one signal.

  Order: observability.otlp_endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the
  configured transport.
*/
OtlpSettings ResolveOtlpSettings(const opentimeline::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

} // namespace opentimeline::observability
