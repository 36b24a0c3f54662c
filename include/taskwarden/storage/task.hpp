#pragma once

#include "taskwarden/util/id.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace taskwarden {

enum class TaskStatus : std::uint8_t {
  Pending,
  Working,
  Completed,
  CompletedWithWarnings,
  CompletedWithErrors,
  Failed,
  Canceled,
  Unknown,
};

enum class TaskOrigin : std::uint8_t {
  Local,
  Cloud,
};

[[nodiscard]] constexpr auto is_terminal(TaskStatus status) noexcept -> bool {
  return status != TaskStatus::Pending && status != TaskStatus::Working;
}

[[nodiscard]] constexpr auto is_success(TaskStatus status) noexcept -> bool {
  return status == TaskStatus::Completed ||
         status == TaskStatus::CompletedWithWarnings ||
         status == TaskStatus::CompletedWithErrors;
}

struct Task {
  TaskId id;
  std::optional<std::string> external_id;
  std::optional<std::string> alias;
  TaskOrigin origin{TaskOrigin::Local};
  TaskStatus status{TaskStatus::Pending};
  std::string instruction;
  std::string working_dir;
  std::optional<std::string> env_id;
  std::optional<std::string> mode;
  std::optional<std::string> model;

  std::int64_t created_at{0};
  std::int64_t updated_at{0};
  std::optional<std::int64_t> completed_at;
  std::optional<std::int64_t> last_event_at;

  std::optional<nlohmann::json> progress;
  std::optional<std::int64_t> poll_frequency_ms;
  std::optional<std::int64_t> keep_alive_until;

  std::optional<std::string> thread_id;
  std::optional<std::string> user_id;

  std::optional<nlohmann::json> result;
  std::optional<nlohmann::json> error;
  std::optional<std::string> error_code;
  std::optional<int> exit_code;

  nlohmann::json metadata = nlohmann::json::object();

  [[nodiscard]] auto terminal() const noexcept -> bool {
    return is_terminal(status);
  }

  // error.message when the error is structured, the raw string otherwise.
  [[nodiscard]] auto error_message() const -> std::string;

  // OS pid of a local worker, parsed from external_id.
  [[nodiscard]] auto worker_pid() const -> std::optional<int>;
};

struct TaskParams {
  std::optional<TaskId> id;
  TaskOrigin origin{TaskOrigin::Local};
  std::string instruction;
  std::string working_dir;
  std::optional<std::string> env_id;
  std::optional<std::string> mode;
  std::optional<std::string> model;
  std::optional<std::string> alias;
  std::optional<std::string> external_id;
  std::optional<std::string> thread_id;
  std::optional<std::string> user_id;
  std::optional<std::int64_t> poll_frequency_ms;
  nlohmann::json metadata = nlohmann::json::object();
};

// Fields to overwrite; unset members leave the column untouched. Metadata is
// merged key by key.
struct TaskPatch {
  std::optional<std::string> external_id;
  std::optional<std::string> alias;
  std::optional<std::string> thread_id;
  std::optional<nlohmann::json> progress;
  std::optional<std::int64_t> last_event_at;
  std::optional<std::int64_t> poll_frequency_ms;
  std::optional<std::int64_t> keep_alive_until;
  std::optional<nlohmann::json> result;
  std::optional<nlohmann::json> error;
  std::optional<std::string> error_code;
  std::optional<int> exit_code;
  std::optional<nlohmann::json> metadata;

  [[nodiscard]] auto empty() const noexcept -> bool {
    return !external_id && !alias && !thread_id && !progress &&
           !last_event_at && !poll_frequency_ms && !keep_alive_until &&
           !result && !error && !error_code && !exit_code && !metadata;
  }
};

struct TaskFilter {
  std::optional<TaskOrigin> origin;
  std::optional<TaskStatus> status;
  std::optional<std::string> working_dir;
  std::optional<std::string> env_id;
  std::optional<std::string> thread_id;
  std::optional<std::string> user_id;
  std::optional<std::int64_t> created_after;
  std::optional<std::int64_t> created_before;
  std::optional<std::size_t> limit;
  std::size_t offset{0};
};

struct RegistryStats {
  std::size_t total{0};
  std::map<std::string, std::size_t, std::less<>> by_status;
  std::map<std::string, std::size_t, std::less<>> by_origin;
  std::size_t running{0};
};

[[nodiscard]] auto to_json(const Task& task) -> nlohmann::json;
[[nodiscard]] auto to_json(const RegistryStats& stats) -> nlohmann::json;

}  // namespace taskwarden
