#pragma once

#include <string>

namespace supervisor::reaper {

// OS process handle operations used when reaping. pid is the opaque
// handle recorded at spawn.
class ProcessController {
 public:
  virtual ~ProcessController() = default;

  virtual bool IsAlive(const std::string& pid) = 0;

  // Best effort; false when the signal could not be delivered.
  virtual bool Terminate(const std::string& pid) = 0;
};

// Local POSIX processes: kill(pid, 0) checks liveness, SIGTERM terminates.
class PosixProcessController final : public ProcessController {
 public:
  bool IsAlive(const std::string& pid) override;
  bool Terminate(const std::string& pid) override;
};

} // namespace supervisor::reaper
