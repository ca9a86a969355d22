#pragma once

#ifdef ENABLE_OTEL

#include <string>

#include <opentelemetry/sdk/resource/resource.h>

namespace supervisor::runtime::config {
class ObservabilityConfig;
}

namespace supervisor::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig ToOtlpConfig(const supervisor::runtime::config::ObservabilityConfig& config);

// Config wins, then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal);

// service.name, service.version and host.name of this supervisor.
opentelemetry::sdk::resource::Resource SupervisorResource();

inline constexpr const char* kInstrumentationName    = "agent-supervisor";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

} // namespace supervisor::observability

#endif
