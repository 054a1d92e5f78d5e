#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace flowstate::runtime::config {
class RuntimeConfig;
}

namespace flowstate::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"flowstate"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const flowstate::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const flowstate::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef FLOWSTATE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // op is one of save, load, checkpoint, recover, export, import
  void RecordOperation(std::string_view op, bool success);
  void ObserveOperationLatencyMs(std::string_view op, double latency_ms);
  void RecordVersionConflict();
  void RecordCacheLookup(bool hit);
  void RecordRecoveryOutcome(std::string_view outcome);
  void ObserveStateSizeBytes(std::uint64_t bytes);

 private:
  Metrics();
#ifdef FLOWSTATE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef FLOWSTATE_ENABLE_OTEL
inline bool InitializeTracing(const flowstate::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const flowstate::runtime::config::RuntimeConfig&) {
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

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordVersionConflict() {
}

inline void Metrics::RecordCacheLookup(bool) {
}

inline void Metrics::RecordRecoveryOutcome(std::string_view) {
}

inline void Metrics::ObserveStateSizeBytes(std::uint64_t) {
}
#endif

} // namespace flowstate::observability
