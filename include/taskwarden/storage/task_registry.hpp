#pragma once

#include "taskwarden/core/error.hpp"
#include "taskwarden/storage/sqlite.hpp"
#include "taskwarden/storage/task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace taskwarden {

struct RegistryOptions {
  std::string db_path{"taskwarden.db"};
  int busy_timeout_ms{5000};
  std::chrono::milliseconds write_retry_delay{50};
};

// Durable task store. Writes go through a dedicated connection inside
// BEGIN IMMEDIATE transactions; reads use a second connection so they see only
// committed rows and never wait on the writer (WAL). A busy or I/O failure is
// retried once after write_retry_delay, then logged and returned.
class TaskRegistry {
public:
  explicit TaskRegistry(RegistryOptions options);
  ~TaskRegistry();

  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return writer_ != nullptr;
  }

  // Creates a pending task. Fails with InvalidArgument on an empty
  // instruction and AlreadyExists on a duplicate explicit id.
  [[nodiscard]] auto register_task(const TaskParams& params) -> Result<Task>;

  // Moves a task along pending -> working -> terminal and applies `patch` in
  // the same transaction. Requesting the current status is a no-op that
  // returns the record unchanged; anything else out of a terminal state is
  // InvalidTransition. Unknown is only reachable through mark_unknown().
  [[nodiscard]] auto update_status(const TaskId& id, TaskStatus status,
                                   const TaskPatch& patch = {})
      -> Result<Task>;

  [[nodiscard]] auto update_task(const TaskId& id, const TaskPatch& patch)
      -> Result<Task>;

  // Stores a serialized progress summary and bumps last_event_at. Ignored
  // once the task is terminal.
  [[nodiscard]] auto update_progress(const TaskId& id,
                                     const nlohmann::json& summary)
      -> Result<Task>;

  // Recovery path for non-terminal tasks whose outcome cannot be determined.
  [[nodiscard]] auto mark_unknown(const TaskId& id, std::string_view reason)
      -> Result<Task>;

  [[nodiscard]] auto get(const TaskId& id) -> Result<Task>;
  // Looks up by id, then by alias (newest first).
  [[nodiscard]] auto resolve(std::string_view id_or_alias) -> Result<Task>;
  // Newest first.
  [[nodiscard]] auto query(const TaskFilter& filter)
      -> Result<std::vector<Task>>;
  [[nodiscard]] auto delete_task(const TaskId& id) -> Result<bool>;

  // Fails every pending or working task created more than max_age_seconds
  // ago. Returns how many were reclaimed.
  [[nodiscard]] auto reclaim_stuck(std::int64_t max_age_seconds)
      -> Result<std::size_t>;
  // Deletes terminal tasks completed before now - max_age whose keep-alive
  // has lapsed.
  [[nodiscard]] auto prune_old(std::chrono::milliseconds max_age)
      -> Result<std::size_t>;

  [[nodiscard]] auto stats() -> Result<RegistryStats>;
  [[nodiscard]] auto schema_version() -> Result<int>;

  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return options_.db_path;
  }

private:
  template <typename T, typename Fn>
  [[nodiscard]] auto write(std::string_view what, Fn&& body) -> Result<T>;
  template <typename T, typename Fn>
  [[nodiscard]] auto read(Fn&& body) -> Result<T>;

  RegistryOptions options_;
  sqlite::Database writer_;
  sqlite::Database reader_;
  std::mutex write_mu_;
  std::mutex read_mu_;
};

}  // namespace taskwarden
