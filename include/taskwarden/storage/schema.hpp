#pragma once

#include "taskwarden/core/error.hpp"

#include <string_view>

struct sqlite3;

namespace taskwarden::schema {

// PRAGMA user_version of a fully migrated database.
//   1  legacy layout, status CHECK without the completed_with_* values
//   2  status CHECK widened to every TaskStatus
//   3  error_code and exit_code columns
inline constexpr int kCurrentVersion = 3;

inline constexpr std::string_view kTasksTable = "tasks";
inline constexpr std::string_view kBackupTable = "tasks_backup";

// Legacy DDL, kept so a version-1 database can be recognised and rebuilt.
inline constexpr std::string_view kTasksV1 = R"(
  CREATE TABLE tasks (
    id TEXT PRIMARY KEY,
    external_id TEXT,
    alias TEXT,
    origin TEXT NOT NULL CHECK(origin IN ('local', 'cloud')),
    status TEXT NOT NULL CHECK(status IN ('pending', 'working', 'completed',
                                          'failed', 'canceled', 'unknown')),
    instruction TEXT NOT NULL,
    working_dir TEXT,
    env_id TEXT,
    mode TEXT,
    model TEXT,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    completed_at INTEGER,
    last_event_at INTEGER,
    progress_steps TEXT,
    poll_frequency_ms INTEGER,
    keep_alive_until INTEGER,
    thread_id TEXT,
    user_id TEXT,
    result TEXT,
    error TEXT,
    metadata TEXT
  );
)";

[[nodiscard]] auto user_version(sqlite3* db) -> Result<int>;

// Puts a backup table left by an interrupted migration back in place of
// `tasks`. Returns true when a backup was restored.
[[nodiscard]] auto restore_backup(sqlite3* db) -> Result<bool>;

// Creates or upgrades the tasks table to kCurrentVersion. Each step runs in
// its own IMMEDIATE transaction. Returns the version found on disk.
[[nodiscard]] auto migrate(sqlite3* db) -> Result<int>;

}  // namespace taskwarden::schema
