#pragma once

#include <stdexcept>
#include <string>

namespace supervisor::util {

// Thrown by registry, telemetry and query code; grpc::ToStatus maps each
// one to a status code at the service boundary.

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Requested lifecycle change is not allowed from the current status.
// Callers treat this as a no-op signal, not something to retry.
class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Terminal status already committed with a different status or reason.
class ConflictingTransition : public std::runtime_error {
 public:
  explicit ConflictingTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Instance reached a terminal status; heartbeats and worker emits are refused.
class InstanceTerminated : public std::runtime_error {
 public:
  explicit InstanceTerminated(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store busy, locked or unreachable. Transient; retry with backoff.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace supervisor::util
