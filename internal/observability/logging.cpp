#include "internal/observability/logging.hpp"

#include <array>
#include <atomic>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace supervisor::observability {
namespace {

constexpr const char* kLoggerName     = "agent-supervisor";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::atomic<bool> g_include_trace_context{false};

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\\' || c == '\n' || c == '\t') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
      case '\\':
        out.push_back('\\');
        out.push_back(c);
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string TraceContextFields() {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  std::array<char, 32> trace_hex{};
  std::array<char, 16> span_hex{};
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  return "trace_id=" + std::string(trace_hex.data(), trace_hex.size()) + " span_id=" + std::string(span_hex.data(), span_hex.size());
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

spdlog::level::level_enum ParseLevel(std::string_view level) {
  // from_str maps unknown names to off, which would silence the daemon
  const auto parsed = spdlog::level::from_str(std::string(level));
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument("logging.level: unknown level '" + std::string(level) + "'");
  }
  return parsed;
}

void InitializeLogging(const supervisor::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(FromEnvOr("SUPERVISOR_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = FromEnvOr("SUPERVISOR_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  bool include_trace = config.logging().include_trace_context();
  if (const char* env = std::getenv("SUPERVISOR_LOG_INCLUDE_TRACE_CONTEXT")) {
    include_trace = std::string_view(env) == "1" || std::string_view(env) == "true";
  }
  g_include_trace_context.store(include_trace);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  if (fields.size() > 0) {
    line.push_back(' ');
    line.append(FormatFields(fields));
  }
  if (g_include_trace_context.load()) {
    if (auto trace = TraceContextFields(); !trace.empty()) {
      line.push_back(' ');
      line.append(trace);
    }
  }
  spdlog::log(level, "{}", line);
}

} // namespace supervisor::observability
