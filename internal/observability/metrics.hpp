#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

namespace opentimeline::runtime::config {
class RuntimeConfig;
}

namespace opentimeline::observability {

bool InitializeMetrics(const opentimeline::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Service instruments:
    opentimeline.rpc.count        {route, outcome}
    opentimeline.rpc.latency_ms   {route, outcome}
    opentimeline.render.entities
    opentimeline.render.timelines (contributing timelines per render)
*/
class Metrics {
 public:
  static Metrics& Instance();

  // outcome is "ok" or a failure class such as "cycle" or "not_found".
  void RecordRpc(std::string_view route, std::string_view outcome, double latency_ms);
  void RecordRender(std::size_t entities, std::size_t contributing_timelines);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const opentimeline::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, std::string_view, double) {
}

inline void Metrics::RecordRender(std::size_t, std::size_t) {
}
#endif

} // namespace opentimeline::observability
