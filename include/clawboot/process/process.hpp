#pragma once

#include "clawboot/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace clawboot::process {

struct ProcessSpec {
  std::string program;
  std::vector<std::string> args;
  std::filesystem::path working_dir;
  std::optional<std::vector<std::string>> env;
  /// Only honoured by run_capture; the child is killed when it expires.
  std::optional<std::chrono::milliseconds> timeout;
};

struct ProcessOutput {
  /// Exit status, or 128 + signal number when the child was killed by a signal.
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
};

class IProcessLauncher {
public:
  virtual ~IProcessLauncher() = default;

  [[nodiscard]] virtual common::Result<ProcessOutput> run_capture(const ProcessSpec &spec) = 0;
  [[nodiscard]] virtual common::Result<int> run(const ProcessSpec &spec) = 0;
  [[nodiscard]] virtual common::Result<pid_t> spawn_background(const ProcessSpec &spec) = 0;
  [[nodiscard]] virtual bool is_running(pid_t pid) = 0;
  virtual void terminate(pid_t pid) = 0;

  [[nodiscard]] virtual common::Status exec_replace(const ProcessSpec &spec) = 0;
  /// Starts the child, forwards termination signals to it, and returns its
  /// exit code once it is gone.
  [[nodiscard]] virtual common::Result<int> supervise(const ProcessSpec &spec) = 0;
};

class PosixProcessLauncher final : public IProcessLauncher {
public:
  [[nodiscard]] common::Result<ProcessOutput> run_capture(const ProcessSpec &spec) override;
  [[nodiscard]] common::Result<int> run(const ProcessSpec &spec) override;
  [[nodiscard]] common::Result<pid_t> spawn_background(const ProcessSpec &spec) override;
  [[nodiscard]] bool is_running(pid_t pid) override;
  void terminate(pid_t pid) override;
  [[nodiscard]] common::Status exec_replace(const ProcessSpec &spec) override;
  [[nodiscard]] common::Result<int> supervise(const ProcessSpec &spec) override;
};

[[nodiscard]] int decode_wait_status(int status);

} // namespace clawboot::process
