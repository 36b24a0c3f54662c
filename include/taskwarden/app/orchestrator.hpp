#pragma once

#include "taskwarden/config/system_config.hpp"
#include "taskwarden/core/error.hpp"
#include "taskwarden/executor/error_classifier.hpp"
#include "taskwarden/executor/process_manager.hpp"
#include "taskwarden/executor/progress.hpp"
#include "taskwarden/security/input_validator.hpp"
#include "taskwarden/security/redactor.hpp"
#include "taskwarden/storage/task.hpp"
#include "taskwarden/storage/task_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskwarden {

struct TaskRequest {
  std::string instruction;
  // Absolute; empty means the current directory.
  std::string working_dir;
  // Empty means the configured defaults.
  std::string mode;
  std::string model;
  std::optional<nlohmann::json> output_schema;
  std::optional<EnvPolicy> env_policy;
  std::vector<std::string> env_allow_list;
  std::optional<std::string> alias;
  std::optional<std::string> thread_id;
  std::optional<std::string> user_id;
  std::optional<std::chrono::milliseconds> idle_timeout;
  std::optional<std::chrono::milliseconds> hard_timeout;
  nlohmann::json metadata = nlohmann::json::object();
};

struct TaskStatusView {
  Task task;
  ProgressSummary progress;
  // True while this orchestrator is running the worker itself.
  bool live{false};
};

struct TaskOutcome {
  TaskId id;
  TaskStatus status{TaskStatus::Pending};
  std::optional<nlohmann::json> result;
  std::optional<nlohmann::json> error;
  std::optional<std::string> error_code;
  std::optional<int> exit_code;
  std::optional<std::int64_t> completed_at;
};

struct OrchestratorStats {
  RegistryStats registry;
  ManagerStats executor;
  std::size_t live_tasks{0};
};

struct CleanupOptions {
  std::int64_t stuck_age_sec{60 * 60};
  std::chrono::milliseconds prune_max_age{std::chrono::hours(7 * 24)};
  bool dry_run{false};
};

struct CleanupReport {
  std::size_t reclaimed{0};
  std::size_t pruned{0};
  bool dry_run{false};
};

[[nodiscard]] auto to_json(const TaskStatusView& view) -> nlohmann::json;
[[nodiscard]] auto to_json(const TaskOutcome& outcome) -> nlohmann::json;
[[nodiscard]] auto to_json(const OrchestratorStats& stats) -> nlohmann::json;
[[nodiscard]] auto to_json(const CleanupReport& report) -> nlohmann::json;

// Runs worker tasks in the background and tracks them in the registry.
// start_task() returns as soon as the task is recorded; the process manager
// drives the worker and finalize() writes exactly one terminal outcome.
// The registry is owned by the caller and must outlive the orchestrator.
class Orchestrator {
public:
  Orchestrator(SystemConfig config, TaskRegistry& registry);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  [[nodiscard]] static auto validate(const TaskRequest& request) -> Validation;

  // InvalidArgument when the request does not validate.
  [[nodiscard]] auto start_task(TaskRequest request) -> Result<TaskId>;

  [[nodiscard]] auto status(std::string_view id_or_alias)
      -> Result<TaskStatusView>;
  // NotTerminal until the task has finished.
  [[nodiscard]] auto results(std::string_view id_or_alias)
      -> Result<TaskOutcome>;
  // Moves a live task to canceled and terminates its worker. Tasks started
  // by another process are terminated through their recorded pid. A
  // terminal task is returned unchanged.
  [[nodiscard]] auto cancel(std::string_view id_or_alias,
                            std::string_view reason = {}) -> Result<Task>;
  // Blocks until the task is terminal; Timeout when `timeout` elapses first.
  [[nodiscard]] auto wait(std::string_view id_or_alias,
                          std::chrono::milliseconds timeout) -> Result<Task>;

  [[nodiscard]] auto cleanup(const CleanupOptions& options)
      -> Result<CleanupReport>;
  [[nodiscard]] auto stats() -> Result<OrchestratorStats>;

  // Terminates every running worker and waits for their outcomes to land.
  auto shutdown() -> void;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }

private:
  struct Run;

  auto build_execute_options(const Task& task, const TaskRequest& request,
                             const std::shared_ptr<Run>& run)
      -> ExecuteOptions;
  auto on_spawn(const std::shared_ptr<Run>& run, pid_t pid) -> void;
  auto on_event(const std::shared_ptr<Run>& run, const Event& event) -> void;
  auto flush_progress(Run& run, bool force) -> void;
  auto finalize(const std::shared_ptr<Run>& run, ProcessResult result) -> void;
  auto cancel_detached(const Task& task, std::string_view reason)
      -> Result<Task>;
  [[nodiscard]] auto find_run(const TaskId& id) const -> std::shared_ptr<Run>;

  SystemConfig config_;
  TaskRegistry& registry_;
  ErrorClassifier classifier_;
  Redactor redactor_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::unordered_map<TaskId, std::shared_ptr<Run>> runs_;

  ProcessManager manager_;
};

}  // namespace taskwarden
