#pragma once

#include "taskwarden/core/error.hpp"
#include "taskwarden/executor/watchdog.hpp"

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskwarden {

enum class EnvPolicy : std::uint8_t {
  InheritNone,
  InheritAll,
  AllowList,
};

[[nodiscard]] auto env_policy_name(EnvPolicy policy) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_env_policy(std::string_view name) noexcept
    -> std::optional<EnvPolicy>;

struct SpawnOptions {
  std::string program;
  std::vector<std::string> args;
  std::string working_dir;
  EnvPolicy env_policy{EnvPolicy::InheritNone};
  std::vector<std::string> env_allow_list;
  // Passed regardless of policy; wins over inherited values.
  std::vector<std::pair<std::string, std::string>> extra_env;
};

// Builds the child's environment ("NAME=value" entries) from the current
// process environment and the policy.
[[nodiscard]] auto build_environment(const SpawnOptions& options)
    -> std::vector<std::string>;

struct ExitStatus {
  std::optional<int> exit_code;
  std::optional<int> signal;
};

// A spawned child in its own process group with stdin on /dev/null and
// stdout/stderr on non-blocking pipes. The child is reaped at most once;
// signals are never sent after reaping so a recycled pid is never hit.
class ChildProcess : public ProcessControl {
public:
  // exec and chdir failures in the child are reported here through a
  // close-on-exec pipe, as the child's errno.
  [[nodiscard]] static auto spawn(const SpawnOptions& options)
      -> Result<std::unique_ptr<ChildProcess>>;

  ~ChildProcess() override;

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  [[nodiscard]] auto pid() const noexcept -> pid_t override {
    return pid_;
  }
  auto send_signal(int sig) noexcept -> bool override;
  [[nodiscard]] auto has_exited() const noexcept -> bool override;

  [[nodiscard]] auto stdout_fd() const noexcept -> int {
    return stdout_fd_;
  }
  [[nodiscard]] auto stderr_fd() const noexcept -> int {
    return stderr_fd_;
  }
  // Readable once the child has terminated; -1 when pidfd is unavailable.
  [[nodiscard]] auto pid_fd() const noexcept -> int {
    return pid_fd_;
  }

  auto close_stdout() noexcept -> void;
  auto close_stderr() noexcept -> void;

  // Blocks until the child terminates, then reaps it.
  auto wait() -> ExitStatus;

private:
  ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);

  pid_t pid_;
  int stdout_fd_;
  int stderr_fd_;
  int pid_fd_{-1};

  mutable std::mutex mu_;
  bool reaped_{false};
  ExitStatus status_;
};

}  // namespace taskwarden
