#pragma once

#include "taskwarden/core/error.hpp"
#include "taskwarden/storage/task_registry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace taskwarden {

struct RecoveryOptions {
  std::int64_t stuck_task_max_age_sec{3600};
  std::chrono::milliseconds prune_max_age{std::chrono::hours{24 * 7}};
};

struct RecoveryResult {
  std::size_t reclaimed{0};
  std::vector<TaskId> orphaned;
  std::size_t pruned{0};
};

// Startup housekeeping for a registry shared by several orchestrator
// processes: fails tasks stuck past their age limit, marks local tasks whose
// worker process has vanished as unknown, and prunes expired history.
class Recovery {
public:
  // Returns whether an OS process with this pid still exists.
  using ProcessProbe = std::function<bool(int pid)>;

  explicit Recovery(TaskRegistry& registry);
  Recovery(TaskRegistry& registry, ProcessProbe probe);

  [[nodiscard]] auto recover(const RecoveryOptions& options)
      -> Result<RecoveryResult>;

  static auto process_alive(int pid) -> bool;

private:
  TaskRegistry& registry_;
  ProcessProbe probe_;
};

}  // namespace taskwarden
