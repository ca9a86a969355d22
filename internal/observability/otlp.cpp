#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <unistd.h>

#include <array>
#include <cstdlib>

#include "config/config.pb.h"

namespace supervisor::observability {
namespace {

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

std::string HostName() {
  std::array<char, 256> buf{};
  if (gethostname(buf.data(), buf.size() - 1) != 0) {
    return "unknown";
  }
  return buf.data();
}

} // namespace

OtlpConfig ToOtlpConfig(const supervisor::runtime::config::ObservabilityConfig& config) {
  OtlpConfig out;
  out.endpoint  = config.otlp_endpoint();
  out.transport = config.transport() == supervisor::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  return out;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = EnvOrNull(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = EnvOrNull("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

opentelemetry::sdk::resource::Resource SupervisorResource() {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", std::string(kInstrumentationName)},
      {"service.version", std::string(kInstrumentationVersion)},
      {"host.name", HostName()},
  };
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace supervisor::observability

#endif
