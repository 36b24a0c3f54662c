#include "taskwarden/storage/recovery.hpp"

#include "taskwarden/util/log.hpp"

#include <cerrno>
#include <format>
#include <utility>
#include <signal.h>

namespace taskwarden {

Recovery::Recovery(TaskRegistry& registry)
    : Recovery(registry, &Recovery::process_alive) {
}

Recovery::Recovery(TaskRegistry& registry, ProcessProbe probe)
    : registry_(registry), probe_(std::move(probe)) {
}

auto Recovery::process_alive(int pid) -> bool {
  if (pid <= 0) {
    return false;
  }
  // EPERM means the pid exists but belongs to someone else.
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

auto Recovery::recover(const RecoveryOptions& options)
    -> Result<RecoveryResult> {
  RecoveryResult result;

  auto reclaimed = registry_.reclaim_stuck(options.stuck_task_max_age_sec);
  if (!reclaimed) {
    log::error("Failed to reclaim stuck tasks");
    return fail(reclaimed.error());
  }
  result.reclaimed = *reclaimed;

  TaskFilter filter;
  filter.origin = TaskOrigin::Local;
  filter.status = TaskStatus::Working;
  auto working = registry_.query(filter);
  if (!working) {
    log::error("Failed to list working tasks");
    return fail(working.error());
  }
  for (const auto& task : *working) {
    auto pid = task.worker_pid();
    if (!pid || probe_(*pid)) {
      continue;
    }
    auto reason = std::format(
        "Worker process {} exited while no orchestrator was watching; the "
        "final outcome is unknown",
        *pid);
    if (auto r = registry_.mark_unknown(task.id, reason); r) {
      result.orphaned.push_back(task.id);
    } else if (r.error() != Error::InvalidTransition) {
      log::warn("Failed to mark orphaned task {}: {}", task.id,
                r.error().message());
    }
  }

  auto pruned = registry_.prune_old(options.prune_max_age);
  if (!pruned) {
    log::error("Failed to prune old tasks");
    return fail(pruned.error());
  }
  result.pruned = *pruned;

  log::info("Recovery complete: {} reclaimed, {} orphaned, {} pruned",
            result.reclaimed, result.orphaned.size(), result.pruned);
  return result;
}

}  // namespace taskwarden
