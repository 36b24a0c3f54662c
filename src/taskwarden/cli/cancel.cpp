#include "taskwarden/cli/commands.hpp"
#include "taskwarden/storage/state_strings.hpp"

#include <print>

namespace taskwarden::cli {

auto cmd_cancel(Orchestrator& app, const CancelOptions& opts) -> int {
  auto task = app.cancel(opts.task, opts.reason);
  if (!task) {
    if (task.error() == Error::NotFound) {
      std::println(stderr, "Error: Task not found: {}", opts.task);
    } else {
      std::println(stderr, "Error: Failed to cancel: {}",
                   task.error().message());
    }
    return 1;
  }
  if (opts.json) {
    print_json(to_json(*task));
  } else if (task->status == TaskStatus::Canceled) {
    std::println("Task {} canceled", task->id);
  } else {
    std::println("Task {} already {}", task->id,
                 task_status_name(task->status));
  }
  return 0;
}

}  // namespace taskwarden::cli
