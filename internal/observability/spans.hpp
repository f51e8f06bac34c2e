#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace artifact::runtime::config {
class RuntimeConfig;
}

namespace artifact::observability {

// Both return false when the signal is disabled in the config.
bool InitializeTracing(const artifact::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const artifact::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for one RPC. Without a tracer every call is a no-op.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // one call per finished RPC
  void RecordRequest(std::string_view route, bool success, double latency_ms);
  // kind: component, asset or blob
  void RecordDeletions(std::string_view kind, std::uint64_t count);
  void RecordBatchChunk(bool committed);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const artifact::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const artifact::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool, double) {
}

inline void Metrics::RecordDeletions(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordBatchChunk(bool) {
}
#endif

} // namespace artifact::observability
