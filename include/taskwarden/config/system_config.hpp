#pragma once

#include "taskwarden/executor/process.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace taskwarden {

struct StorageConfig {
  std::string db_file{"taskwarden.db"};
  int busy_timeout_ms{5000};
  int write_retry_delay_ms{50};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
};

struct ExecutorConfig {
  std::string worker{"codex"};
  std::vector<std::string> worker_args;
  int max_concurrency{2};
  std::size_t max_output_bytes{10 * 1024 * 1024};
  EnvPolicy env_policy{EnvPolicy::InheritNone};
  std::vector<std::string> env_allow_list;
  // Forwarded even under inherit_none so the worker can be located and find
  // its own credentials.
  std::vector<std::string> env_always{"PATH", "HOME"};
  std::string default_mode{"read-only"};
  std::string default_model;
};

struct WatchdogLimits {
  std::int64_t idle_timeout_ms{5 * 60 * 1000};
  std::int64_t hard_timeout_ms{20 * 60 * 1000};
  std::int64_t warn_lead_ms{30 * 1000};
  std::int64_t kill_grace_ms{5 * 1000};
  std::int64_t progress_interval_ms{30 * 1000};
};

struct RegistryConfig {
  std::int64_t stuck_task_max_age_sec{60 * 60};
  std::int64_t prune_max_age_ms{7LL * 24 * 60 * 60 * 1000};
  std::int64_t progress_flush_interval_ms{1000};
  std::int64_t default_poll_frequency_ms{5000};
  std::int64_t result_keep_alive_ms{60 * 60 * 1000};
};

struct SystemConfig {
  StorageConfig storage;
  LoggingConfig logging;
  ExecutorConfig executor;
  WatchdogLimits watchdog;
  RegistryConfig registry;
};

}  // namespace taskwarden
