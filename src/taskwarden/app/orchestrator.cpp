#include "taskwarden/app/orchestrator.hpp"

#include "taskwarden/executor/result_extractor.hpp"
#include "taskwarden/executor/worker_command.hpp"
#include "taskwarden/storage/recovery.hpp"
#include "taskwarden/storage/state_strings.hpp"
#include "taskwarden/util/log.hpp"
#include "taskwarden/util/tail_buffer.hpp"
#include "taskwarden/util/time.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <thread>
#include <utility>

#include <signal.h>

namespace taskwarden {

namespace {

inline constexpr std::size_t kResultTailChars = 2000;
inline constexpr auto kWaitPollInterval = std::chrono::milliseconds(250);
inline constexpr auto kKillPollInterval = std::chrono::milliseconds(50);

auto default_cancel_reason(std::string_view reason) -> std::string {
  return reason.empty() ? std::string{"Task was canceled"}
                        : std::string{reason};
}

auto cancel_error(std::string_view reason) -> nlohmann::json {
  return {{"code", "CANCELLED"}, {"message", default_cancel_reason(reason)}};
}

auto outcome_of(const Task& task) -> TaskOutcome {
  return TaskOutcome{task.id,        task.status,    task.result,
                     task.error,     task.error_code, task.exit_code,
                     task.completed_at};
}

}  // namespace

struct Orchestrator::Run {
  TaskId id;
  CancellationSource cancel;

  std::mutex mu;
  ProgressEngine engine;
  bool dirty{false};
  Clock::time_point last_flush{Clock::now()};
  std::optional<ProcessId> process_id;

  // Serializes progress writes so an older snapshot never lands after a
  // newer one.
  std::mutex flush_mu;
};

auto to_json(const TaskStatusView& view) -> nlohmann::json {
  auto j = to_json(view.task);
  j["progress"] = progress_to_json(view.progress);
  j["live"] = view.live;
  return j;
}

auto to_json(const TaskOutcome& outcome) -> nlohmann::json {
  nlohmann::json j = {
      {"id", outcome.id.str()},
      {"status", task_status_name(outcome.status)},
      {"result", outcome.result.value_or(nullptr)},
      {"error", outcome.error.value_or(nullptr)},
  };
  j["error_code"] = outcome.error_code ? nlohmann::json(*outcome.error_code)
                                       : nlohmann::json(nullptr);
  j["exit_code"] = outcome.exit_code ? nlohmann::json(*outcome.exit_code)
                                     : nlohmann::json(nullptr);
  j["completed_at"] = outcome.completed_at
                          ? nlohmann::json(*outcome.completed_at)
                          : nlohmann::json(nullptr);
  return j;
}

auto to_json(const OrchestratorStats& stats) -> nlohmann::json {
  return {
      {"registry", to_json(stats.registry)},
      {"executor",
       {{"active_processes", stats.executor.active_processes},
        {"running", stats.executor.queue.running},
        {"queued", stats.executor.queue.queued},
        {"max_concurrency", stats.executor.queue.max_concurrency}}},
      {"live_tasks", stats.live_tasks},
  };
}

auto to_json(const CleanupReport& report) -> nlohmann::json {
  return {{"reclaimed", report.reclaimed},
          {"pruned", report.pruned},
          {"dry_run", report.dry_run}};
}

Orchestrator::Orchestrator(SystemConfig config, TaskRegistry& registry)
    : config_(std::move(config)),
      registry_(registry),
      manager_(static_cast<std::size_t>(
          std::max(1, config_.executor.max_concurrency))) {
}

Orchestrator::~Orchestrator() {
  shutdown();
}

auto Orchestrator::validate(const TaskRequest& request) -> Validation {
  return InputValidator::validate_all(request.instruction, request.mode,
                                      request.model, request.working_dir,
                                      request.output_schema);
}

auto Orchestrator::start_task(TaskRequest request) -> Result<TaskId> {
  if (auto v = validate(request); !v) {
    log::warn("Rejected task request: {}: {}", v.error().field,
              v.error().message);
    return fail(Error::InvalidArgument);
  }

  TaskParams params;
  params.origin = TaskOrigin::Local;
  params.instruction = request.instruction;
  params.working_dir = request.working_dir;
  params.alias = request.alias;
  params.thread_id = request.thread_id;
  params.user_id = request.user_id;
  params.poll_frequency_ms = config_.registry.default_poll_frequency_ms;
  params.metadata = request.metadata.is_object() ? request.metadata
                                                 : nlohmann::json::object();
  auto mode = request.mode.empty() ? config_.executor.default_mode
                                   : request.mode;
  auto model = request.model.empty() ? config_.executor.default_model
                                     : request.model;
  if (!mode.empty()) {
    params.mode = mode;
  }
  if (!model.empty()) {
    params.model = model;
  }

  auto task = registry_.register_task(params);
  if (!task) {
    log::error("Failed to register task: {}", task.error().message());
    return fail(task.error());
  }

  auto run = std::make_shared<Run>();
  run->id = task->id;
  {
    std::lock_guard lock(mu_);
    runs_.emplace(run->id, run);
  }

  request.mode = std::move(mode);
  request.model = std::move(model);
  auto options = build_execute_options(*task, request, run);
  auto process_id = manager_.execute(
      std::move(options), [this, run](ProcessResult result) {
        finalize(run, std::move(result));
      });
  {
    std::lock_guard lock(run->mu);
    run->process_id = process_id;
  }

  log::info("Task {} queued as {}", task->id, process_id);
  return task->id;
}

auto Orchestrator::build_execute_options(const Task& task,
                                         const TaskRequest& request,
                                         const std::shared_ptr<Run>& run)
    -> ExecuteOptions {
  const auto& exec = config_.executor;
  auto policy = request.env_policy.value_or(exec.env_policy);
  auto allow_list =
      request.env_allow_list.empty() ? exec.env_allow_list
                                     : request.env_allow_list;

  ExecuteOptions options;
  options.label = task.id.str();
  options.cancel_token = run->cancel.token();
  options.max_output_bytes = exec.max_output_bytes;

  options.spawn.program = exec.worker;
  options.spawn.args = exec.worker_args;
  auto worker_args = build_worker_args(WorkerRequest{
      request.instruction, request.mode, request.model,
      request.output_schema, policy, allow_list, {}});
  options.spawn.args.insert(options.spawn.args.end(), worker_args.begin(),
                            worker_args.end());
  options.spawn.working_dir = task.working_dir;
  options.spawn.env_policy = policy;
  options.spawn.env_allow_list = allow_list;
  for (const auto& name : exec.env_always) {
    if (const char* value = std::getenv(name.c_str())) {
      options.spawn.extra_env.emplace_back(name, value);
    }
  }

  const auto& limits = config_.watchdog;
  auto& wd = options.watchdog;
  wd.idle_timeout = request.idle_timeout.value_or(
      std::chrono::milliseconds(limits.idle_timeout_ms));
  wd.hard_timeout = request.hard_timeout.value_or(
      std::chrono::milliseconds(limits.hard_timeout_ms));
  wd.warn_lead = std::chrono::milliseconds(limits.warn_lead_ms);
  wd.kill_grace = std::chrono::milliseconds(limits.kill_grace_ms);
  wd.progress_interval = std::chrono::milliseconds(limits.progress_interval_ms);
  wd.on_progress = [this, run](const WatchdogHeartbeat& hb) {
    log::debug("Task {} alive: {}ms elapsed, {}ms idle, {} events", run->id,
               hb.elapsed_ms, hb.idle_ms, hb.event_count);
    flush_progress(*run, false);
  };
  wd.on_warning = [id = task.id](const WatchdogWarning& warning) {
    log::warn("Task {}: {}", id, warning.message);
  };
  wd.on_timeout = [id = task.id](const TimeoutInfo& info,
                                 const PartialResults& partial) {
    log::warn("Task {} timed out ({}) after {}ms with {} events", id,
              timeout_kind_name(info.kind), info.elapsed_ms,
              partial.event_count);
  };

  options.on_spawn = [this, run](pid_t pid) { on_spawn(run, pid); };
  options.on_event = [this, run](const Event& event) { on_event(run, event); };
  return options;
}

auto Orchestrator::on_spawn(const std::shared_ptr<Run>& run, pid_t pid)
    -> void {
  TaskPatch patch;
  patch.external_id = std::to_string(pid);
  patch.last_event_at = now_ms();
  auto updated = registry_.update_status(run->id, TaskStatus::Working, patch);
  if (updated) {
    return;
  }
  if (updated.error() != Error::InvalidTransition) {
    log::error("Failed to mark task {} working: {}", run->id,
               updated.error().message());
    return;
  }
  // Canceled or reclaimed from elsewhere before the worker came up.
  log::warn("Task {} left pending before its worker started, stopping pid {}",
            run->id, pid);
  std::optional<ProcessId> process_id;
  {
    std::lock_guard lock(run->mu);
    process_id = run->process_id;
  }
  run->cancel.cancel();
  if (process_id) {
    manager_.cancel(*process_id);
  }
}

auto Orchestrator::on_event(const std::shared_ptr<Run>& run,
                            const Event& event) -> void {
  {
    std::lock_guard lock(run->mu);
    run->engine.process_event(event);
    run->dirty = true;
  }
  flush_progress(*run, false);
}

auto Orchestrator::flush_progress(Run& run, bool force) -> void {
  std::lock_guard flush_lock(run.flush_mu);
  nlohmann::json snapshot;
  {
    std::lock_guard lock(run.mu);
    auto interval =
        std::chrono::milliseconds(config_.registry.progress_flush_interval_ms);
    if (!run.dirty || (!force && Clock::now() - run.last_flush < interval)) {
      return;
    }
    snapshot = progress_to_json(run.engine.progress());
    run.dirty = false;
    run.last_flush = Clock::now();
  }
  if (auto r = registry_.update_progress(run.id, snapshot); !r) {
    log::warn("Failed to store progress for {}: {}", run.id,
              r.error().message());
  }
}

auto Orchestrator::finalize(const std::shared_ptr<Run>& run,
                            ProcessResult result) -> void {
  ProgressSummary progress;
  {
    std::lock_guard lock(run->mu);
    progress = run->engine.progress();
  }

  nlohmann::json payload = {
      {"summary", extract_summary(result.events)},
      {"event_count", result.events.size()},
      {"duration_ms", result.duration_ms},
      {"stdout_tail", tail_of(result.stdout_output, kResultTailChars)},
      {"stderr_tail", tail_of(result.stderr_output, kResultTailChars)},
  };
  auto file_changes = extract_file_changes(result.events);
  auto commands = extract_commands(result.events);
  auto warnings = extract_warnings(result.stderr_output);
  payload["file_changes"] = nlohmann::json::array();
  for (const auto& change : file_changes) {
    payload["file_changes"].push_back(to_json(change));
  }
  payload["commands"] = nlohmann::json::array();
  for (const auto& command : commands) {
    payload["commands"].push_back(to_json(command));
  }
  payload["warnings"] = warnings;
  if (auto structured = extract_structured_output(result.events)) {
    payload["structured_output"] = std::move(*structured);
  }
  payload["exit_code"] = result.exit_code ? nlohmann::json(*result.exit_code)
                                          : nlohmann::json(nullptr);
  if (result.output_truncated) {
    payload["output_truncated"] = true;
  }

  TaskPatch patch;
  patch.exit_code = result.exit_code;
  patch.keep_alive_until = now_ms() + config_.registry.result_keep_alive_ms;

  if (run->cancel.is_cancelled()) {
    // cancel() owns the terminal transition; only the output is kept.
    patch.result = redactor_.redact(payload);
    patch.progress = progress_to_json(progress);
    if (auto r = registry_.update_task(run->id, patch); !r) {
      log::warn("Failed to store output of canceled task {}: {}", run->id,
                r.error().message());
    }
  } else {
    TaskStatus status = TaskStatus::Completed;
    if (auto classified = classifier_.classify(result)) {
      status = TaskStatus::Failed;
      log::warn("Task {} failed: {} {}", run->id,
                error_code_name(classified->code), classified->message);
      patch.error = redactor_.redact(to_json(*classified));
      patch.error_code = std::string{error_code_name(classified->code)};
      progress.has_failed = true;
    } else {
      nlohmann::json failed = nlohmann::json::array();
      for (const auto& command : commands) {
        if (command.exit_code > 0) {
          failed.push_back(to_json(command));
        }
      }
      if (!failed.empty()) {
        status = TaskStatus::CompletedWithErrors;
        patch.error = redactor_.redact(nlohmann::json{
            {"message", std::format("{} command(s) exited with a non-zero "
                                    "status",
                                    failed.size())},
            {"failed_commands", std::move(failed)}});
      } else if (!warnings.empty()) {
        status = TaskStatus::CompletedWithWarnings;
        patch.error = redactor_.redact(nlohmann::json{
            {"message",
             std::format("Worker reported {} warning(s)", warnings.size())},
            {"warnings", warnings}});
      }
      progress.is_complete = true;
      progress.percent = 100;
      progress.current_action.reset();
    }
    patch.result = redactor_.redact(payload);
    patch.progress = progress_to_json(progress);

    auto updated = registry_.update_status(run->id, status, patch);
    if (updated) {
      log::info("Task {} finished as {} in {}ms", run->id,
                task_status_name(status), result.duration_ms);
    } else if (updated.error() == Error::InvalidTransition) {
      log::info("Task {} was already finished elsewhere, keeping that outcome",
                run->id);
    } else {
      log::error("Failed to store outcome of task {}: {}", run->id,
                 updated.error().message());
    }
  }

  {
    std::lock_guard lock(mu_);
    runs_.erase(run->id);
  }
  cv_.notify_all();
}

auto Orchestrator::find_run(const TaskId& id) const -> std::shared_ptr<Run> {
  std::lock_guard lock(mu_);
  auto it = runs_.find(id);
  return it == runs_.end() ? nullptr : it->second;
}

auto Orchestrator::status(std::string_view id_or_alias)
    -> Result<TaskStatusView> {
  auto task = registry_.resolve(id_or_alias);
  if (!task) {
    return fail(task.error());
  }
  TaskStatusView view;
  if (auto run = find_run(task->id); run && !task->terminal()) {
    std::lock_guard lock(run->mu);
    view.progress = run->engine.progress();
    view.live = true;
  } else if (task->progress) {
    view.progress = progress_from_json(*task->progress).value_or(
        ProgressSummary{});
  }
  view.task = std::move(*task);
  return view;
}

auto Orchestrator::results(std::string_view id_or_alias)
    -> Result<TaskOutcome> {
  auto task = registry_.resolve(id_or_alias);
  if (!task) {
    return fail(task.error());
  }
  if (!task->terminal()) {
    return fail(Error::NotTerminal);
  }
  return outcome_of(*task);
}

auto Orchestrator::cancel(std::string_view id_or_alias,
                          std::string_view reason) -> Result<Task> {
  auto task = registry_.resolve(id_or_alias);
  if (!task) {
    return fail(task.error());
  }
  if (task->terminal()) {
    log::info("Task {} already {}, nothing to cancel", task->id,
              task_status_name(task->status));
    return task;
  }

  auto run = find_run(task->id);
  if (!run) {
    return cancel_detached(*task, reason);
  }

  run->cancel.cancel();
  TaskPatch patch;
  patch.error = cancel_error(reason);
  auto updated = registry_.update_status(task->id, TaskStatus::Canceled, patch);
  if (!updated && updated.error() != Error::InvalidTransition) {
    log::error("Failed to mark task {} canceled: {}", task->id,
               updated.error().message());
    return fail(updated.error());
  }

  std::optional<ProcessId> process_id;
  {
    std::lock_guard lock(run->mu);
    process_id = run->process_id;
  }
  if (process_id) {
    manager_.cancel(*process_id);
  }
  log::info("Canceled task {}: {}", task->id, default_cancel_reason(reason));

  if (!updated) {
    // Finished on its own before the cancel landed.
    return registry_.get(task->id);
  }
  return updated;
}

auto Orchestrator::cancel_detached(const Task& task, std::string_view reason)
    -> Result<Task> {
  auto pid = task.worker_pid();
  if (task.status == TaskStatus::Working && pid) {
    log::info("Terminating worker pid {} of task {}", *pid, task.id);
    // Workers lead their own process group.
    if (::kill(-*pid, SIGTERM) != 0 && ::kill(*pid, SIGTERM) != 0) {
      log::debug("pid {} already gone", *pid);
    }
    auto deadline = Clock::now() +
                    std::chrono::milliseconds(config_.watchdog.kill_grace_ms);
    while (Recovery::process_alive(*pid) && Clock::now() < deadline) {
      std::this_thread::sleep_for(kKillPollInterval);
    }
    if (Recovery::process_alive(*pid)) {
      log::warn("pid {} ignored SIGTERM, sending SIGKILL", *pid);
      if (::kill(-*pid, SIGKILL) != 0) {
        ::kill(*pid, SIGKILL);
      }
    }
  }

  TaskPatch patch;
  patch.error = cancel_error(reason);
  auto updated = registry_.update_status(task.id, TaskStatus::Canceled, patch);
  if (!updated) {
    if (updated.error() == Error::InvalidTransition) {
      return registry_.get(task.id);
    }
    log::error("Failed to mark task {} canceled: {}", task.id,
               updated.error().message());
    return fail(updated.error());
  }
  log::info("Canceled task {}: {}", task.id, default_cancel_reason(reason));
  return updated;
}

auto Orchestrator::wait(std::string_view id_or_alias,
                        std::chrono::milliseconds timeout) -> Result<Task> {
  auto deadline = Clock::now() + timeout;
  for (;;) {
    auto task = registry_.resolve(id_or_alias);
    if (!task) {
      return fail(task.error());
    }
    if (task->terminal()) {
      return task;
    }
    auto now = Clock::now();
    if (now >= deadline) {
      log::debug("Gave up waiting for task {} after {}ms", task->id,
                 timeout.count());
      return fail(Error::Timeout);
    }
    // Local runs wake us on finalize; tasks owned by another process are
    // polled.
    auto slice = std::min<Clock::duration>(deadline - now, kWaitPollInterval);
    std::unique_lock lock(mu_);
    if (runs_.contains(task->id)) {
      cv_.wait_for(lock, slice, [&] { return !runs_.contains(task->id); });
    } else {
      cv_.wait_for(lock, slice);
    }
  }
}

auto Orchestrator::cleanup(const CleanupOptions& options)
    -> Result<CleanupReport> {
  CleanupReport report;
  report.dry_run = options.dry_run;

  if (!options.dry_run) {
    auto reclaimed = registry_.reclaim_stuck(options.stuck_age_sec);
    if (!reclaimed) {
      return fail(reclaimed.error());
    }
    auto pruned = registry_.prune_old(options.prune_max_age);
    if (!pruned) {
      return fail(pruned.error());
    }
    report.reclaimed = *reclaimed;
    report.pruned = *pruned;
    log::info("Cleanup: {} reclaimed, {} pruned", report.reclaimed,
              report.pruned);
    return report;
  }

  auto now = now_ms();
  for (auto status : {TaskStatus::Pending, TaskStatus::Working}) {
    TaskFilter filter;
    filter.status = status;
    filter.created_before = now - options.stuck_age_sec * 1000;
    auto stuck = registry_.query(filter);
    if (!stuck) {
      return fail(stuck.error());
    }
    report.reclaimed += stuck->size();
  }

  auto cutoff = now - options.prune_max_age.count();
  TaskFilter filter;
  filter.created_before = cutoff;
  auto old = registry_.query(filter);
  if (!old) {
    return fail(old.error());
  }
  report.pruned = static_cast<std::size_t>(
      std::ranges::count_if(*old, [&](const Task& task) {
        return task.terminal() && task.completed_at &&
               *task.completed_at < cutoff &&
               (!task.keep_alive_until || *task.keep_alive_until < now);
      }));
  return report;
}

auto Orchestrator::stats() -> Result<OrchestratorStats> {
  auto registry = registry_.stats();
  if (!registry) {
    return fail(registry.error());
  }
  OrchestratorStats stats;
  stats.registry = std::move(*registry);
  stats.executor = manager_.stats();
  {
    std::lock_guard lock(mu_);
    stats.live_tasks = runs_.size();
  }
  return stats;
}

auto Orchestrator::shutdown() -> void {
  std::vector<std::shared_ptr<Run>> live;
  {
    std::lock_guard lock(mu_);
    for (const auto& [id, run] : runs_) {
      live.push_back(run);
    }
  }
  if (!live.empty()) {
    log::info("Stopping {} live task(s)", live.size());
  }
  for (const auto& run : live) {
    if (!run->cancel.cancel()) {
      continue;
    }
    TaskPatch patch;
    patch.error = cancel_error("Orchestrator shut down before the task "
                               "finished");
    auto r = registry_.update_status(run->id, TaskStatus::Canceled, patch);
    if (!r && r.error() != Error::InvalidTransition) {
      log::error("Failed to mark task {} canceled: {}", run->id,
                 r.error().message());
    }
  }
  manager_.shutdown();
}

}  // namespace taskwarden
