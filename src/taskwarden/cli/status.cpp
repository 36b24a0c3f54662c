#include "taskwarden/cli/commands.hpp"
#include "taskwarden/storage/state_strings.hpp"

#include <print>

namespace taskwarden::cli {

auto cmd_status(Orchestrator& app, const StatusOptions& opts) -> int {
  auto view = app.status(opts.task);
  if (!view) {
    if (view.error() == Error::NotFound) {
      std::println(stderr, "Error: Task not found: {}", opts.task);
    } else {
      std::println(stderr, "Error: {}", view.error().message());
    }
    return 1;
  }
  if (opts.json) {
    print_json(to_json(*view));
    return 0;
  }

  const auto& task = view->task;
  const auto& progress = view->progress;
  std::println("Task:     {}", task.id);
  if (task.alias) {
    std::println("Alias:    {}", *task.alias);
  }
  std::println("Status:   {}", task_status_name(task.status));
  std::println("Dir:      {}", task.working_dir);
  std::println("Progress: {}% ({}/{} steps)", progress.percent,
               progress.completed_steps, progress.total_steps);
  if (progress.current_action) {
    std::println("Action:   {}", *progress.current_action);
  }
  std::println("Files:    {}  Commands: {}", progress.files_changed,
               progress.commands_executed);
  if (auto pid = task.worker_pid()) {
    std::println("Pid:      {}", *pid);
  }
  std::println("Created:  {}", format_time(task.created_at));
  std::println("Updated:  {}", format_time(task.updated_at));
  if (task.completed_at) {
    std::println("Ended:    {}", format_time(*task.completed_at));
  }
  if (task.terminal() && !is_success(task.status)) {
    std::println("Error:    {}", task.error_message());
  }
  return 0;
}

}  // namespace taskwarden::cli
