#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace casetrack::runtime::config {
class RuntimeConfig;
}

namespace casetrack::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"casetrack"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const casetrack::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments. Every method is a no-op when the build has
  no OpenTelemetry or metrics are disabled in configuration.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // outcome: proceed | replay | fingerprint_conflict | in_progress
  void RecordIdempotencyOutcome(std::string_view outcome);
  // event: acquired | refreshed | conflict | auto_released | released
  void RecordLockEvent(std::string_view event);
  void RecordBreakerTransition(std::string_view dependency, std::string_view to_state);
  void RecordLifecycleTransition(std::string_view from_state, std::string_view to_state);
  void RecordSequenceAllocation(std::string_view domain);
  void ObserveMutationLatencyMs(std::string_view operation, bool committed, double latency_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const casetrack::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordIdempotencyOutcome(std::string_view) {
}

inline void Metrics::RecordLockEvent(std::string_view) {
}

inline void Metrics::RecordBreakerTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordLifecycleTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordSequenceAllocation(std::string_view) {
}

inline void Metrics::ObserveMutationLatencyMs(std::string_view, bool, double) {
}
#endif

} // namespace casetrack::observability
