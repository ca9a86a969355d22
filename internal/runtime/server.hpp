#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace supervisor::runtime {

struct ServerOptions {
  std::string bind_address;
  // Subscribe handlers notice shutdown on their next poll; the grace period
  // must cover at least one poll interval.
  uint64_t shutdown_grace_ms = 5'000;
  // Keepalive pings let the server drop subscribers whose peer vanished
  // without closing the stream.
  uint64_t keepalive_time_ms    = 60'000;
  uint64_t keepalive_timeout_ms = 20'000;
};

class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Port actually bound; differs from bind_address when it asked for :0.
  int Port() const { return selected_port_; }

private:
  ServerOptions options_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

} // namespace supervisor::runtime
