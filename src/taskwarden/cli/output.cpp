#include "taskwarden/cli/commands.hpp"
#include "taskwarden/storage/state_strings.hpp"

#include <chrono>
#include <format>
#include <print>

namespace taskwarden::cli {

auto print_json(const nlohmann::json& value) -> void {
  std::println("{}", value.dump(2, ' ', false,
                                nlohmann::json::error_handler_t::replace));
}

auto format_time(std::int64_t epoch_ms) -> std::string {
  if (epoch_ms <= 0) {
    return "-";
  }
  auto t = std::chrono::system_clock::from_time_t(epoch_ms / 1000);
  return std::format("{:%Y-%m-%d %H:%M:%S}", t);
}

auto exit_code_for(TaskStatus status) noexcept -> int {
  return is_success(status) ? 0 : 1;
}

auto print_outcome(const TaskOutcome& outcome) -> void {
  std::println("Task:    {}", outcome.id);
  std::println("Status:  {}", task_status_name(outcome.status));
  if (outcome.exit_code) {
    std::println("Exit:    {}", *outcome.exit_code);
  }
  if (outcome.completed_at) {
    std::println("Ended:   {}", format_time(*outcome.completed_at));
  }

  if (outcome.result && outcome.result->is_object()) {
    const auto& r = *outcome.result;
    if (auto it = r.find("summary"); it != r.end() && it->is_string()) {
      std::println("Summary: {}", it->get<std::string>());
    }
    if (auto it = r.find("file_changes");
        it != r.end() && it->is_array() && !it->empty()) {
      std::println("Files:");
      for (const auto& change : *it) {
        std::println("  {:<9} {}", change.value("operation", "modified"),
                     change.value("path", "unknown"));
      }
    }
    if (auto it = r.find("commands");
        it != r.end() && it->is_array() && !it->empty()) {
      std::println("Commands:");
      for (const auto& command : *it) {
        std::println("  [{:>3}] {}", command.value("exit_code", -1),
                     command.value("command", ""));
      }
    }
  }

  if (outcome.error) {
    std::string message;
    if (outcome.error->is_object()) {
      message = outcome.error->value("message", "");
    } else if (outcome.error->is_string()) {
      message = outcome.error->get<std::string>();
    }
    if (outcome.error_code) {
      std::println("Error:   [{}] {}", *outcome.error_code, message);
    } else {
      std::println("Error:   {}", message);
    }
    if (outcome.error->is_object()) {
      auto suggestion = outcome.error->value("suggestion", "");
      if (!suggestion.empty()) {
        std::println("Hint:    {}", suggestion);
      }
    }
  }
}

}  // namespace taskwarden::cli
