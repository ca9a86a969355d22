#include "internal/db/db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace supervisor::db {

bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::IOError || code == ErrorCode::SerializationFailure;
}

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (IsTransient(result.code)) {
    throw supervisor::util::StoreUnavailable(message);
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw supervisor::util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw supervisor::util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace supervisor::db
