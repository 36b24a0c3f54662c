#pragma once

#include "taskwarden/app/orchestrator.hpp"
#include "taskwarden/storage/task.hpp"
#include "taskwarden/storage/task_registry.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace taskwarden::cli {

// Exit status for "not finished yet" (wait timeout, results of a live task).
inline constexpr int kExitPending = 2;

struct RunOptions {
  TaskRequest request;
  bool json{false};
  // Set by the signal handler; the running task is canceled when it flips.
  const std::atomic<bool>* interrupted{nullptr};
};

struct StatusOptions {
  std::string task;
  bool json{false};
};

struct ResultsOptions {
  std::string task;
  bool json{false};
};

struct WaitOptions {
  std::string task;
  std::int64_t timeout_sec{300};
  bool json{false};
};

struct CancelOptions {
  std::string task;
  std::string reason;
  bool json{false};
};

struct ListOptions {
  TaskFilter filter;
  bool json{false};
};

struct CleanupCommandOptions {
  CleanupOptions cleanup;
  bool json{false};
};

[[nodiscard]] auto cmd_run(Orchestrator& app, const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_status(Orchestrator& app, const StatusOptions& opts)
    -> int;
[[nodiscard]] auto cmd_results(Orchestrator& app, const ResultsOptions& opts)
    -> int;
[[nodiscard]] auto cmd_wait(Orchestrator& app, const WaitOptions& opts) -> int;
[[nodiscard]] auto cmd_cancel(Orchestrator& app, const CancelOptions& opts)
    -> int;
[[nodiscard]] auto cmd_list(TaskRegistry& registry, const ListOptions& opts)
    -> int;
[[nodiscard]] auto cmd_cleanup(Orchestrator& app,
                               const CleanupCommandOptions& opts) -> int;
[[nodiscard]] auto cmd_stats(Orchestrator& app) -> int;

// Shared output helpers.
auto print_json(const nlohmann::json& value) -> void;
[[nodiscard]] auto format_time(std::int64_t epoch_ms) -> std::string;
auto print_outcome(const TaskOutcome& outcome) -> void;
// 0 for the completed states, 1 otherwise.
[[nodiscard]] auto exit_code_for(TaskStatus status) noexcept -> int;

}  // namespace taskwarden::cli
