#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace supervisor::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

// Prefix of the FAILED_PRECONDITION message for calls on a terminated instance,
// so workers can tell it apart from an invalid transition.
inline constexpr const char* kInstanceTerminatedPrefix = "instance terminated: ";

::grpc::Status ToStatus(const std::exception& e);

} // namespace supervisor::grpc
