#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace supervisor::runtime {

using supervisor::observability::IntField;
using supervisor::observability::StringField;

Server::Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
  if (options_.bind_address.empty()) {
    throw std::invalid_argument("server: bind_address is required");
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, grpc::InsecureServerCredentials(), &selected_port_);

  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, static_cast<int>(options_.keepalive_time_ms));
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, static_cast<int>(options_.keepalive_timeout_ms));
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("server: failed to listen on " + options_.bind_address);
  }

  SUPERVISOR_LOG_INFO("Agent supervisor listening",
                      {StringField("bind_address", options_.bind_address), IntField("port", selected_port_),
                       IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }
  grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::milliseconds(options_.shutdown_grace_ms));
  grpc_server_->Wait();
  grpc_server_.reset();
}

} // namespace supervisor::runtime
