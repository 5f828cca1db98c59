#pragma once

#include <memory>
#include <string_view>

namespace opentimeline::runtime::config {
class RuntimeConfig;
}

namespace opentimeline::observability {

// No-ops unless built with ENABLE_OTEL and observability.tracing_enabled is set.
bool InitializeTracing(const opentimeline::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// Active span for the lifetime of one RPC.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  // Marks the span as failed.
  void RecordError(std::string_view outcome, std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const opentimeline::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordError(std::string_view, std::string_view) {
}
#endif

} // namespace opentimeline::observability
