#include "taskwarden/storage/task.hpp"

#include "taskwarden/storage/state_strings.hpp"

#include <charconv>

namespace taskwarden {

namespace {

template <typename T>
auto put_optional(nlohmann::json& j, const char* key,
                  const std::optional<T>& value) -> void {
  if (value) {
    j[key] = *value;
  }
}

}  // namespace

auto Task::error_message() const -> std::string {
  if (!error || error->is_null()) {
    return {};
  }
  if (error->is_string()) {
    return error->get<std::string>();
  }
  if (error->is_object()) {
    if (auto it = error->find("message");
        it != error->end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return error->dump(-1, ' ', false,
                     nlohmann::json::error_handler_t::replace);
}

auto Task::worker_pid() const -> std::optional<int> {
  if (origin != TaskOrigin::Local || !external_id || external_id->empty()) {
    return std::nullopt;
  }
  int pid = 0;
  const auto* first = external_id->data();
  const auto* last = first + external_id->size();
  auto [ptr, ec] = std::from_chars(first, last, pid);
  if (ec != std::errc{} || ptr != last || pid <= 0) {
    return std::nullopt;
  }
  return pid;
}

auto to_json(const Task& task) -> nlohmann::json {
  nlohmann::json j = {
      {"id", task.id.str()},
      {"origin", task_origin_name(task.origin)},
      {"status", task_status_name(task.status)},
      {"instruction", task.instruction},
      {"working_dir", task.working_dir},
      {"created_at", task.created_at},
      {"updated_at", task.updated_at},
      {"metadata", task.metadata},
  };
  put_optional(j, "external_id", task.external_id);
  put_optional(j, "alias", task.alias);
  put_optional(j, "env_id", task.env_id);
  put_optional(j, "mode", task.mode);
  put_optional(j, "model", task.model);
  put_optional(j, "completed_at", task.completed_at);
  put_optional(j, "last_event_at", task.last_event_at);
  put_optional(j, "progress", task.progress);
  put_optional(j, "poll_frequency_ms", task.poll_frequency_ms);
  put_optional(j, "keep_alive_until", task.keep_alive_until);
  put_optional(j, "thread_id", task.thread_id);
  put_optional(j, "user_id", task.user_id);
  put_optional(j, "result", task.result);
  put_optional(j, "error", task.error);
  put_optional(j, "error_code", task.error_code);
  put_optional(j, "exit_code", task.exit_code);
  return j;
}

auto to_json(const RegistryStats& stats) -> nlohmann::json {
  nlohmann::json by_status = nlohmann::json::object();
  for (const auto& [k, v] : stats.by_status) {
    by_status[k] = v;
  }
  nlohmann::json by_origin = nlohmann::json::object();
  for (const auto& [k, v] : stats.by_origin) {
    by_origin[k] = v;
  }
  return {{"total", stats.total},
          {"running", stats.running},
          {"by_status", std::move(by_status)},
          {"by_origin", std::move(by_origin)}};
}

}  // namespace taskwarden
