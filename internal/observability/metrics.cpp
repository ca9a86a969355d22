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

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define SUPERVISOR_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define SUPERVISOR_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace supervisor::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kMetrics);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// Collection defaults to the heartbeat cadence scale rather than the SDK's
// one minute, so a reap shows up in dashboards within seconds.
sdkmetrics::PeriodicExportingMetricReaderOptions ReaderOptions(const supervisor::runtime::config::ObservabilityConfig::MetricsConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(config.collection_interval_ms() > 0 ? config.collection_interval_ms() : 5000);
  if (config.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(config.export_timeout_ms());
  }
  return options;
}

template <typename Provider>
void ConfigureResource(Provider& provider, const opentelemetry::sdk::resource::Resource& res) {
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

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      reaper_tick_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> instances_reaped;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> subscriber_disconnects;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> emitter_dropped_events;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> heartbeats;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> entries_committed;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   reaper_degraded_gauge;

  std::atomic<std::int64_t> reaper_degraded{0};
};

bool InitializeMetrics(const supervisor::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto exporter = MakeMetricExporter(ToOtlpConfig(observability));
#ifdef SUPERVISOR_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), ReaderOptions(observability.metrics()));
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), ReaderOptions(observability.metrics()));
#endif

  auto resource = SupervisorResource();
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
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
  impl_->meter  = provider->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->request_count          = impl_->meter->CreateUInt64Counter("supervisor.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms     = impl_->meter->CreateDoubleHistogram("supervisor.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->reaper_tick_ms         = impl_->meter->CreateDoubleHistogram("supervisor.reaper.tick_ms", "ms", "Liveness reaper tick duration in milliseconds");
  impl_->instances_reaped       = impl_->meter->CreateUInt64Counter("supervisor.reaper.instances_reaped", "1", "Instances demoted for stale heartbeat");
  impl_->subscriber_disconnects = impl_->meter->CreateUInt64Counter("supervisor.stream.subscriber_disconnects", "1", "Stream subscribers disconnected");
  impl_->emitter_dropped_events = impl_->meter->CreateUInt64Counter("supervisor.emitter.dropped_events", "1", "Events dropped from a full local emit queue");
  impl_->heartbeats             = impl_->meter->CreateUInt64Counter("supervisor.heartbeat.count", "1", "Heartbeats received, by accepted");
  impl_->entries_committed      = impl_->meter->CreateUInt64Counter("supervisor.transcript.entries", "1", "Transcript entries committed, by entry type");
  impl_->reaper_degraded_gauge  = impl_->meter->CreateInt64ObservableGauge("supervisor.reaper.degraded", "1 while the reaper is failing consecutive ticks", "1");
  impl_->reaper_degraded_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->reaper_degraded.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route.data(), route.size())}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route.data(), route.size())}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::ObserveReaperTickMs(double duration_ms) {
  if (!impl_ || !impl_->reaper_tick_ms) {
    return;
  }
  RecordWithAttributes(impl_->reaper_tick_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordInstancesReaped(std::uint64_t count) {
  if (!impl_ || !impl_->instances_reaped || count == 0) {
    return;
  }
  AddWithAttributes(impl_->instances_reaped, count, std::initializer_list<AttributePair>{});
}

void Metrics::SetReaperDegraded(bool degraded) {
  if (!impl_) {
    return;
  }
  impl_->reaper_degraded.store(degraded ? 1 : 0);
}

void Metrics::RecordSubscriberDisconnect(std::string_view reason) {
  if (!impl_ || !impl_->subscriber_disconnects) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"reason", opentelemetry::nostd::string_view(reason.data(), reason.size())}};
  AddWithAttributes(impl_->subscriber_disconnects, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordEmitterDroppedEvents(std::uint64_t count) {
  if (!impl_ || !impl_->emitter_dropped_events || count == 0) {
    return;
  }
  AddWithAttributes(impl_->emitter_dropped_events, count, std::initializer_list<AttributePair>{});
}

void Metrics::RecordHeartbeat(bool accepted) {
  if (!impl_ || !impl_->heartbeats) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"accepted", accepted}};
  AddWithAttributes(impl_->heartbeats, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordEntryCommitted(std::string_view entry_type) {
  if (!impl_ || !impl_->entries_committed) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"entry_type", opentelemetry::nostd::string_view(entry_type.data(), entry_type.size())}};
  AddWithAttributes(impl_->entries_committed, static_cast<std::uint64_t>(1), attributes);
}

} // namespace supervisor::observability

#endif
