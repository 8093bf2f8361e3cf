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

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace casetrack::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
bool                                       g_enabled{false};

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> idempotency_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_events;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> breaker_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lifecycle_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> sequence_allocations;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      mutation_latency_ms;
};

bool InitializeMetrics(const casetrack::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == casetrack::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms                = observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max<int64_t>(interval_ms, 100));
  auto reader                           = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  g_enabled = true;
  return true;
}

void ShutdownMetrics() {
  g_enabled = false;
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("casetrack", "0.1.0");

  impl_->idempotency_outcomes  = impl_->meter->CreateUInt64Counter("casetrack.idempotency.outcomes", "Idempotency reservation outcomes", "1");
  impl_->lock_events           = impl_->meter->CreateUInt64Counter("casetrack.lock.events", "Entity lock events", "1");
  impl_->breaker_transitions   = impl_->meter->CreateUInt64Counter("casetrack.breaker.transitions", "Circuit breaker state changes", "1");
  impl_->lifecycle_transitions = impl_->meter->CreateUInt64Counter("casetrack.lifecycle.transitions", "Applied lifecycle transitions", "1");
  impl_->sequence_allocations  = impl_->meter->CreateUInt64Counter("casetrack.sequence.allocations", "Sequence values issued", "1");
  impl_->mutation_latency_ms   = impl_->meter->CreateDoubleHistogram("casetrack.mutation.latency_ms", "Mutation latency in milliseconds", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordIdempotencyOutcome(std::string_view outcome) {
  if (!g_enabled) return;
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->idempotency_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordLockEvent(std::string_view event) {
  if (!g_enabled) return;
  const std::initializer_list<AttributePair> attributes = {{"event", std::string(event)}};
  AddWithAttributes(impl_->lock_events, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordBreakerTransition(std::string_view dependency, std::string_view to_state) {
  if (!g_enabled) return;
  const std::initializer_list<AttributePair> attributes = {{"dependency", std::string(dependency)}, {"state", std::string(to_state)}};
  AddWithAttributes(impl_->breaker_transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordLifecycleTransition(std::string_view from_state, std::string_view to_state) {
  if (!g_enabled) return;
  const std::initializer_list<AttributePair> attributes = {{"from", std::string(from_state)}, {"to", std::string(to_state)}};
  AddWithAttributes(impl_->lifecycle_transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordSequenceAllocation(std::string_view domain) {
  if (!g_enabled) return;
  const std::initializer_list<AttributePair> attributes = {{"domain", std::string(domain)}};
  AddWithAttributes(impl_->sequence_allocations, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveMutationLatencyMs(std::string_view operation, bool committed, double latency_ms) {
  if (!g_enabled) return;
  const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}, {"committed", committed}};
  RecordWithAttributes(impl_->mutation_latency_ms, latency_ms, attributes);
}

} // namespace casetrack::observability

#endif
