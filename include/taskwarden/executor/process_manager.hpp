#pragma once

#include "taskwarden/core/cancellation.hpp"
#include "taskwarden/core/error.hpp"
#include "taskwarden/executor/process.hpp"
#include "taskwarden/executor/process_queue.hpp"
#include "taskwarden/executor/watchdog.hpp"
#include "taskwarden/protocol/event.hpp"
#include "taskwarden/protocol/event_parser.hpp"
#include "taskwarden/util/id.hpp"
#include "taskwarden/util/time.hpp"

#include <sys/types.h>

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace taskwarden {

struct SpawnFailure {
  std::error_code code;
  std::string message;
};

// Outcome of one execution. Exactly one of: exit status set, spawn_error
// set, timeout set, or cancelled before spawn.
struct ProcessResult {
  ProcessId process_id;
  pid_t pid{-1};
  std::vector<Event> events;
  std::string stdout_output;
  std::string stderr_output;
  std::optional<int> exit_code;
  std::optional<int> signal;
  std::optional<TimeoutInfo> timeout;
  std::optional<PartialResults> partial;
  std::optional<SpawnFailure> spawn_error;
  bool cancelled{false};
  bool output_truncated{false};
  ParserStats parser_stats;
  std::int64_t duration_ms{0};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0 && !timeout && !spawn_error && !cancelled;
  }
};

using ProcessCallback = std::move_only_function<void(ProcessResult)>;

struct ExecuteOptions {
  SpawnOptions spawn;
  WatchdogConfig watchdog;
  // Label used in logs, usually the task id.
  std::string label;
  CancellationToken cancel_token;
  std::size_t max_output_bytes{10 * 1024 * 1024};

  // Called on the job's I/O thread, in stream order.
  std::function<void(const Event&)> on_event;
  std::function<void(pid_t)> on_spawn;
};

struct ProcessInfo {
  ProcessId id;
  pid_t pid{-1};
  std::string label;
  std::int64_t started_at{0};
};

struct ManagerStats {
  std::size_t active_processes{0};
  QueueStats queue;
};

struct Submission {
  ProcessId id;
  std::future<ProcessResult> result;
};

// Runs worker processes through a bounded FIFO queue. Each admitted job
// spawns its process, pumps stdout through the event parser, guards it with
// a watchdog and resolves once. A timeout resolves the job immediately; the
// process is still reaped before its slot is released.
class ProcessManager {
public:
  explicit ProcessManager(
      std::size_t max_concurrency = ProcessQueue::kDefaultMaxConcurrency);
  ~ProcessManager();

  ProcessManager(const ProcessManager&) = delete;
  ProcessManager& operator=(const ProcessManager&) = delete;

  [[nodiscard]] auto execute(ExecuteOptions options) -> Submission;
  auto execute(ExecuteOptions options, ProcessCallback callback) -> ProcessId;

  // Cancels a queued or running job. Returns false for unknown or finished
  // jobs.
  auto cancel(const ProcessId& id) -> bool;

  // Cancels every queued job and terminates every running process.
  auto kill_all() -> void;

  // kill_all(), then waits for every job to resolve.
  auto shutdown() -> void;

  [[nodiscard]] auto stats() const -> ManagerStats;
  [[nodiscard]] auto active_processes() const -> std::vector<ProcessInfo>;

private:
  struct Job;

  auto submit(ExecuteOptions options, ProcessCallback callback) -> ProcessId;
  auto run_job(const std::shared_ptr<Job>& job) -> void;
  auto pump_output(Job& job, ChildProcess& child, Watchdog& watchdog,
                   EventStreamParser& parser) -> void;
  auto take_event(Job& job, Watchdog& watchdog, Event event) -> void;
  [[nodiscard]] auto snapshot(Job& job) -> ProcessResult;
  auto resolve(Job& job, ProcessResult result) -> void;
  auto finish(const ProcessId& id) -> void;

  ProcessQueue queue_;

  mutable std::mutex mu_;
  std::unordered_map<ProcessId, std::shared_ptr<Job>> jobs_;
};

}  // namespace taskwarden
