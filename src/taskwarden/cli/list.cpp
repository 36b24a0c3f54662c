#include "taskwarden/cli/commands.hpp"
#include "taskwarden/storage/state_strings.hpp"

#include <print>

namespace taskwarden::cli {

namespace {

auto clip(std::string_view text, std::size_t width) -> std::string {
  if (text.size() <= width) {
    return std::string{text};
  }
  return std::string{text.substr(0, width - 3)} + "...";
}

}  // namespace

auto cmd_list(TaskRegistry& registry, const ListOptions& opts) -> int {
  auto tasks = registry.query(opts.filter);
  if (!tasks) {
    std::println(stderr, "Error: {}", tasks.error().message());
    return 1;
  }

  if (opts.json) {
    auto out = nlohmann::json::array();
    for (const auto& task : *tasks) {
      out.push_back(to_json(task));
    }
    print_json(out);
    return 0;
  }

  if (tasks->empty()) {
    std::println("No tasks found.");
    return 0;
  }

  std::println("{:<32} {:<24} {:<20} {}", "TASK_ID", "STATUS", "CREATED",
               "INSTRUCTION");
  for (const auto& task : *tasks) {
    std::println("{:<32} {:<24} {:<20} {}", task.id.str(),
                 task_status_name(task.status), format_time(task.created_at),
                 clip(task.instruction, 60));
  }
  return 0;
}

}  // namespace taskwarden::cli
