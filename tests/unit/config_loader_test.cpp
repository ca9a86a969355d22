#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/supervisor_options.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "agent_supervisor_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\supervisor\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = supervisor::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\supervisor\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestFullConfigRoundsThroughOptions() {
  auto config = supervisor::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "127.0.0.1:6000"
database:
  memory: {}
liveness:
  heartbeat_interval_ms: 1000
  stale_timeout_multiplier: 4
  record_heartbeat_entries: true
reaper:
  enabled: true
  tick_period_ms: 250
  signal_processes: false
  alert_after_failures: 2
store_retry:
  max_attempts: 3
  initial_backoff_ms: 10
  max_backoff_ms: 40
  local_queue_capacity: 16
stream:
  subscriber_queue_capacity: 8
  poll_interval_ms: 50
logging:
  level: "debug"
)");

  assert(config.database().has_memory());
  assert(config.reaper().has_signal_processes());

  auto options = supervisor::config::ResolveOptions(config);
  assert(options.bind_address == "127.0.0.1:6000");
  assert(options.liveness.heartbeat_interval_ms == 1000);
  assert(options.liveness.StaleTimeoutMs() == 4000);
  assert(options.liveness.record_heartbeat_entries);
  assert(options.reaper.enabled);
  assert(options.reaper.tick_period_ms == 250);
  assert(!options.reaper.signal_processes);
  assert(options.reaper.alert_after_failures == 2);
  assert(options.store_retry.max_attempts == 3);
  assert(options.store_retry.local_queue_capacity == 16);
  assert(options.stream.subscriber_queue_capacity == 8);
  assert(options.stream.poll_interval_ms == 50);
}

void TestEmptyConfigResolvesToDefaults() {
  auto config  = supervisor::config::ConfigLoader::LoadFromYamlString("");
  auto options = supervisor::config::ResolveOptions(config);

  assert(options.bind_address == "0.0.0.0:50061");
  assert(options.liveness.heartbeat_interval_ms == 30'000);
  assert(options.liveness.StaleTimeoutMs() == 90'000);
  assert(!options.liveness.record_heartbeat_entries);
  assert(options.reaper.enabled);
  assert(options.reaper.signal_processes);
  assert(options.reaper.tick_period_ms == 10'000);
  assert(options.store_retry.max_attempts == 5);
}

void TestReaperPeriodMustBeShorterThanTimeout() {
  auto config = supervisor::config::ConfigLoader::LoadFromYamlString(R"(liveness:
  heartbeat_interval_ms: 100
  stale_timeout_multiplier: 2
reaper:
  tick_period_ms: 200
)");

  bool threw = false;
  try {
    (void)supervisor::config::ResolveOptions(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  // a disabled reaper has no period constraint
  config.mutable_reaper()->set_enabled(false);
  auto options = supervisor::config::ResolveOptions(config);
  assert(!options.reaper.enabled);
}

void TestMultiplierBelowOneIsRejected() {
  auto config = supervisor::config::ConfigLoader::LoadFromYamlString(R"(liveness:
  stale_timeout_multiplier: 0.5
)");

  bool threw = false;
  try {
    (void)supervisor::config::ResolveOptions(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
database:
  sqlite:
    path: "/tmp/data"
    wal_mode: false
)");

  bool threw = false;
  try {
    (void)supervisor::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEnvironmentExpansion() {
  ::setenv("AGENT_SUPERVISOR_TEST_PG_PASSWORD", "s3cret", 1);
  auto config = supervisor::config::ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://supervisor:${AGENT_SUPERVISOR_TEST_PG_PASSWORD}@db/supervisor"
)");
  assert(config.database().postgres().connection_uri() == "postgresql://supervisor:s3cret@db/supervisor");

  ::unsetenv("AGENT_SUPERVISOR_TEST_PG_PASSWORD");
  bool threw = false;
  try {
    (void)supervisor::config::ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://supervisor:${AGENT_SUPERVISOR_TEST_PG_PASSWORD}@db/supervisor"
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestQuotedScalarsStayStrings() {
  auto config = supervisor::config::ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "true"
  include_trace_context: true
)");
  assert(config.logging().pattern() == "true");
  assert(config.logging().include_trace_context());
}

void TestNonMappingRootIsRejected() {
  bool threw = false;
  try {
    (void)supervisor::config::ConfigLoader::LoadFromYamlString("- server\n- database\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestFullConfigRoundsThroughOptions();
  TestEmptyConfigResolvesToDefaults();
  TestReaperPeriodMustBeShorterThanTimeout();
  TestMultiplierBelowOneIsRejected();
  TestUnknownFieldsAreRejected();
  TestEnvironmentExpansion();
  TestQuotedScalarsStayStrings();
  TestNonMappingRootIsRejected();

  std::cout << "agent_supervisor_unit_config_loader: pass\n";
  return 0;
}
