#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace syncq::runtime::config {
class RuntimeConfig;
}

namespace syncq::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"syncq"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const syncq::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const syncq::runtime::config::RuntimeConfig& config);
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
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Queue instruments.

  Counters are labelled by outcome ("accepted", "deduplicated",
  "rejected", "committed", "retried", "dead", ...). Gauges keep the last
  value set per label and are reported on collection.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordEnqueue(std::string_view priority, std::string_view outcome);
  void RecordDelivery(std::string_view outcome);
  void RecordDeadLetter(std::string_view reason);
  void RecordReap(std::uint64_t count);
  void RecordBreakerTransition(std::string_view state);
  void ObserveBatchLatencyMs(double latency_ms);
  void SetDepth(std::string_view status, std::uint64_t count);
  void SetOldestPendingAgeMs(std::string_view priority, std::int64_t age_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const syncq::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const syncq::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordEnqueue(std::string_view, std::string_view) {
}

inline void Metrics::RecordDelivery(std::string_view) {
}

inline void Metrics::RecordDeadLetter(std::string_view) {
}

inline void Metrics::RecordReap(std::uint64_t) {
}

inline void Metrics::RecordBreakerTransition(std::string_view) {
}

inline void Metrics::ObserveBatchLatencyMs(double) {
}

inline void Metrics::SetDepth(std::string_view, std::uint64_t) {
}

inline void Metrics::SetOldestPendingAgeMs(std::string_view, std::int64_t) {
}
#endif

} // namespace syncq::observability
