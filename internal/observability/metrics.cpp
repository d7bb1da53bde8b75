#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define SYNCQ_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define SYNCQ_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace syncq::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool priority_labels_enabled{true};
};

MetricsOptions g_metrics_options;

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

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
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

using GaugeValues = std::unordered_map<std::string, std::int64_t>;

struct GaugeState {
  std::mutex* mutex;
  GaugeValues values;
  const char* label;
};

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> enqueue_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> delivery_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dead_letter_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reaped_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> breaker_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      batch_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   depth_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   oldest_pending_gauge;

  std::mutex gauge_mutex;
  GaugeState depth{&gauge_mutex, {}, "status"};
  GaugeState oldest_pending{&gauge_mutex, {}, "priority"};
};

namespace {

void ObserveGauge(metrics_api::ObserverResult result, void* state) {
  auto*                       gauge = static_cast<GaugeState*>(state);
  std::lock_guard<std::mutex> lock(*gauge->mutex);
  auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
  for (const auto& [label, value] : gauge->values) {
    const std::initializer_list<AttributePair> attributes = {{gauge->label, label}};
    int_result->Observe(value, attributes);
  }
}

} // namespace

bool InitializeMetrics(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
#ifdef SYNCQ_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const syncq::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  otlp_config.transport =
      observability.transport() == syncq::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

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

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto                                       min_interval_ms = metric_config.min_collection_interval_ms();
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(min_interval_ms, configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

#ifdef SYNCQ_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(otlp_config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.priority_labels_enabled = metric_config.priority_labels_enabled();

  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("syncq", "0.1.0");

  impl_->enqueue_count       = impl_->meter->CreateUInt64Counter("syncq.enqueue.count", "Enqueue calls by outcome", "1");
  impl_->delivery_count      = impl_->meter->CreateUInt64Counter("syncq.delivery.count", "Delivery dispositions by outcome", "1");
  impl_->dead_letter_count   = impl_->meter->CreateUInt64Counter("syncq.dead_letter.count", "Items moved to Dead", "1");
  impl_->reaped_count        = impl_->meter->CreateUInt64Counter("syncq.reaped.count", "Expired reservations returned to Pending", "1");
  impl_->breaker_transitions = impl_->meter->CreateUInt64Counter("syncq.breaker.transitions", "Circuit breaker state entries", "1");
  impl_->batch_latency_ms    = impl_->meter->CreateDoubleHistogram("syncq.batch.latency_ms", "Forwarder batch latency in milliseconds", "ms");

  impl_->depth_gauge = impl_->meter->CreateInt64ObservableGauge("syncq.queue.depth", "Items per status", "1");
  impl_->depth_gauge->AddCallback(ObserveGauge, &impl_->depth);
  impl_->oldest_pending_gauge =
      impl_->meter->CreateInt64ObservableGauge("syncq.queue.oldest_pending_age_ms", "Age of the oldest Pending item per priority", "ms");
  impl_->oldest_pending_gauge->AddCallback(ObserveGauge, &impl_->oldest_pending);
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordEnqueue(std::string_view priority, std::string_view outcome) {
  if (!impl_ || !impl_->enqueue_count) {
    return;
  }

  if (g_metrics_options.priority_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"priority", std::string(priority)}, {"outcome", std::string(outcome)}};
    AddWithAttributes(impl_->enqueue_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->enqueue_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordDelivery(std::string_view outcome) {
  if (!impl_ || !impl_->delivery_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->delivery_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordDeadLetter(std::string_view reason) {
  if (!impl_ || !impl_->dead_letter_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"reason", std::string(reason)}};
  AddWithAttributes(impl_->dead_letter_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordReap(std::uint64_t count) {
  if (!impl_ || !impl_->reaped_count || count == 0) {
    return;
  }

  AddWithAttributes(impl_->reaped_count, count, std::initializer_list<AttributePair>{});
}

void Metrics::RecordBreakerTransition(std::string_view state) {
  if (!impl_ || !impl_->breaker_transitions) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"state", std::string(state)}};
  AddWithAttributes(impl_->breaker_transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveBatchLatencyMs(double latency_ms) {
  if (!impl_ || !impl_->batch_latency_ms) {
    return;
  }

  RecordWithAttributes(impl_->batch_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::SetDepth(std::string_view status, std::uint64_t count) {
  if (!impl_ || !impl_->depth_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->gauge_mutex);
  impl_->depth.values[std::string(status)] = static_cast<std::int64_t>(count);
}

void Metrics::SetOldestPendingAgeMs(std::string_view priority, std::int64_t age_ms) {
  if (!impl_ || !impl_->oldest_pending_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->gauge_mutex);
  const std::string label = g_metrics_options.priority_labels_enabled ? std::string(priority) : std::string("all");
  auto& slot = impl_->oldest_pending.values[label];
  slot       = g_metrics_options.priority_labels_enabled ? age_ms : std::max(slot, age_ms);
}

} // namespace syncq::observability

#endif
