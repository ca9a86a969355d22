#include <pthread.h>
#include <signal.h>

#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reaper/liveness_reaper.hpp"
#include "internal/runtime/server.hpp"
#include "internal/telemetry/resilient_emitter.hpp"

using supervisor::observability::IntField;
using supervisor::observability::StringField;

namespace {

void ShutdownObservability() {
  supervisor::observability::ShutdownMetrics();
  supervisor::observability::ShutdownTracing();
  supervisor::observability::ShutdownLogging();
}

int Usage() {
  std::cerr << "Usage: agent-supervisor <config.yaml>\n"
            << "       agent-supervisor --config <config.yaml>\n";
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2 && std::string(argv[1]) != "--config") {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    return Usage();
  }

  // Blocked before any thread starts so only sigwait below sees them.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  try {
    auto config = supervisor::config::ConfigLoader::LoadFromYaml(config_path);

    supervisor::observability::InitializeLogging(config);
    supervisor::observability::InitializeTracing(config);
    supervisor::observability::InitializeMetrics(config);

    auto app = supervisor::factory::Build(config);

    supervisor::runtime::ServerOptions server_options;
    server_options.bind_address      = app.ctx.options.bind_address;
    server_options.shutdown_grace_ms = std::max<uint64_t>(server_options.shutdown_grace_ms, 2 * app.ctx.options.stream.poll_interval_ms);

    supervisor::runtime::Server server(server_options, std::move(app.grpc_services));
    server.Start();

    int signal_number = 0;
    sigwait(&stop_signals, &signal_number);
    SUPERVISOR_LOG_INFO("Shutting down agent supervisor", {IntField("signal", signal_number)});

    // reaper first so no instance is demoted while the server drains
    if (app.ctx.reaper) {
      app.ctx.reaper->Stop();
    }
    server.Stop();

    if (app.supervisor_emitter) {
      app.supervisor_emitter->Flush();
      if (const auto left = app.supervisor_emitter->QueuedCount(); left > 0) {
        SUPERVISOR_LOG_WARN("Supervisor records not written before exit", {IntField("queued", static_cast<int64_t>(left))});
      }
    }

    ShutdownObservability();
  } catch (const std::exception& e) {
    SUPERVISOR_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
