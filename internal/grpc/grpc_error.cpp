#include "grpc_error.hpp"

namespace supervisor::grpc {

namespace {

template <typename T>
bool Is(const std::exception& e) {
  return dynamic_cast<const T*>(&e) != nullptr;
}

::grpc::StatusCode CodeFor(const std::exception& e) {
  namespace util = supervisor::util;

  if (Is<util::NotFound>(e)) return ::grpc::StatusCode::NOT_FOUND;
  if (Is<util::InvalidArgument>(e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (Is<util::InstanceTerminated>(e) || Is<util::InvalidTransition>(e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  if (Is<util::ConflictingTransition>(e)) return ::grpc::StatusCode::ABORTED;
  if (Is<util::StoreUnavailable>(e)) return ::grpc::StatusCode::UNAVAILABLE;
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (Is<supervisor::util::InstanceTerminated>(e)) {
    return {CodeFor(e), std::string(kInstanceTerminatedPrefix) + e.what()};
  }
  return {CodeFor(e), e.what()};
}

} // namespace supervisor::grpc
