#include "process_controller.hpp"

#include <cerrno>
#include <charconv>
#include <csignal>
#include <optional>
#include <sys/types.h>

#include "internal/observability/logging.hpp"

namespace supervisor::reaper {

namespace {

// Only plain positive integers are treated as local pids; 0 and negatives
// would address process groups.
std::optional<pid_t> ParsePid(const std::string& handle) {
  long value = 0;
  const auto* begin = handle.data();
  const auto* end   = handle.data() + handle.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end || value <= 0) {
    return std::nullopt;
  }
  return static_cast<pid_t>(value);
}

} // namespace

bool PosixProcessController::IsAlive(const std::string& handle) {
  const auto pid = ParsePid(handle);
  if (!pid.has_value()) {
    return false;
  }
  if (::kill(*pid, 0) == 0) {
    return true;
  }
  // exists but owned by someone else
  return errno == EPERM;
}

bool PosixProcessController::Terminate(const std::string& handle) {
  const auto pid = ParsePid(handle);
  if (!pid.has_value()) {
    return false;
  }
  if (::kill(*pid, SIGTERM) != 0) {
    SUPERVISOR_LOG_WARN("SIGTERM failed", {supervisor::observability::StringField("pid", handle),
                                           supervisor::observability::IntField("errno", errno)});
    return false;
  }
  return true;
}

} // namespace supervisor::reaper
