#include "taskwarden/cli/commands.hpp"
#include "taskwarden/storage/state_strings.hpp"

#include <chrono>
#include <print>

namespace taskwarden::cli {

auto cmd_wait(Orchestrator& app, const WaitOptions& opts) -> int {
  auto task = app.wait(opts.task, std::chrono::seconds(opts.timeout_sec));
  if (!task) {
    if (task.error() == Error::Timeout) {
      std::println(stderr, "Task {} still running after {}s", opts.task,
                   opts.timeout_sec);
      return kExitPending;
    }
    std::println(stderr, "Error: {}", task.error().message());
    return 1;
  }
  if (opts.json) {
    print_json(to_json(*task));
  } else {
    std::println("{} {}", task->id, task_status_name(task->status));
  }
  return exit_code_for(task->status);
}

}  // namespace taskwarden::cli
