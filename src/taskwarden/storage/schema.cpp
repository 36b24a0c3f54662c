#include "taskwarden/storage/schema.hpp"

#include "taskwarden/storage/sqlite.hpp"
#include "taskwarden/util/log.hpp"

#include <sqlite3.h>

#include <array>
#include <format>
#include <functional>

namespace taskwarden::schema {

namespace {

constexpr std::string_view kTasksV2 = R"(
  CREATE TABLE tasks (
    id TEXT PRIMARY KEY,
    external_id TEXT,
    alias TEXT,
    origin TEXT NOT NULL CHECK(origin IN ('local', 'cloud')),
    status TEXT NOT NULL CHECK(status IN ('pending', 'working', 'completed',
                                          'completed_with_warnings',
                                          'completed_with_errors', 'failed',
                                          'canceled', 'unknown')),
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

constexpr std::string_view kTasksV3 = R"(
  CREATE TABLE tasks (
    id TEXT PRIMARY KEY,
    external_id TEXT,
    alias TEXT,
    origin TEXT NOT NULL CHECK(origin IN ('local', 'cloud')),
    status TEXT NOT NULL CHECK(status IN ('pending', 'working', 'completed',
                                          'completed_with_warnings',
                                          'completed_with_errors', 'failed',
                                          'canceled', 'unknown')),
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
    metadata TEXT,
    error_code TEXT,
    exit_code INTEGER
  );
)";

constexpr std::string_view kLegacyColumns =
    "id, external_id, alias, origin, status, instruction, working_dir, "
    "env_id, mode, model, created_at, updated_at, completed_at, "
    "last_event_at, progress_steps, poll_frequency_ms, keep_alive_until, "
    "thread_id, user_id, result, error, metadata";

constexpr std::string_view kIndexes = R"(
  CREATE INDEX IF NOT EXISTS idx_status_updated
    ON tasks(status, updated_at DESC);
  CREATE INDEX IF NOT EXISTS idx_origin_status
    ON tasks(origin, status, updated_at DESC);
  CREATE INDEX IF NOT EXISTS idx_working_dir
    ON tasks(working_dir, updated_at DESC);
  CREATE INDEX IF NOT EXISTS idx_user_thread
    ON tasks(user_id, thread_id, updated_at DESC);
  CREATE INDEX IF NOT EXISTS idx_created_at
    ON tasks(created_at DESC);
)";

// Index names follow their table through ALTER TABLE RENAME, so they must be
// dropped before a rebuild can recreate them on the new table.
constexpr std::string_view kDropIndexes = R"(
  DROP INDEX IF EXISTS idx_status_updated;
  DROP INDEX IF EXISTS idx_origin_status;
  DROP INDEX IF EXISTS idx_working_dir;
  DROP INDEX IF EXISTS idx_user_thread;
  DROP INDEX IF EXISTS idx_created_at;
)";

auto set_user_version(sqlite3* db, int version) -> Result<void> {
  return sqlite::exec(db, std::format("PRAGMA user_version = {};", version));
}

auto count_rows(sqlite3* db, std::string_view table) -> Result<std::int64_t> {
  auto stmt = sqlite::prepare(db, std::format("SELECT COUNT(*) FROM {};", table));
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  int rc = sqlite3_step(stmt->get());
  if (rc != SQLITE_ROW) {
    return fail(sqlite::error_from(rc));
  }
  return stmt->int64(0);
}

auto has_column(sqlite3* db, std::string_view column) -> Result<bool> {
  auto stmt = sqlite::prepare(db, "PRAGMA table_info(tasks);");
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
    if (stmt->text(1) == column) {
      return true;
    }
  }
  if (rc != SQLITE_DONE) {
    return fail(sqlite::error_from(rc));
  }
  return false;
}

auto table_sql(sqlite3* db) -> Result<std::string> {
  auto stmt = sqlite::prepare(
      db, "SELECT sql FROM sqlite_master WHERE type = 'table' AND name = 'tasks';");
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_ROW) {
    return stmt->text(0);
  }
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  return fail(sqlite::error_from(rc));
}

// Version implied by the shape of the tasks table, for databases whose
// user_version cannot be trusted.
auto detect_version(sqlite3* db) -> Result<int> {
  auto with_codes = has_column(db, "error_code");
  if (!with_codes) {
    return std::unexpected(with_codes.error());
  }
  if (*with_codes) {
    return 3;
  }
  auto sql = table_sql(db);
  if (!sql) {
    return std::unexpected(sql.error());
  }
  return sql->find("completed_with_warnings") != std::string::npos ? 2 : 1;
}

auto in_transaction(sqlite3* db, const std::function<Result<void>()>& body)
    -> Result<void> {
  if (auto r = sqlite::exec(db, "BEGIN IMMEDIATE;"); !r) {
    return r;
  }
  if (auto r = body(); !r) {
    if (auto rb = sqlite::exec(db, "ROLLBACK;"); !rb) {
      log::error("Rollback after failed migration step also failed: {}",
                 rb.error().message());
    }
    return r;
  }
  return sqlite::exec(db, "COMMIT;");
}

auto create_fresh(sqlite3* db) -> Result<void> {
  return in_transaction(db, [db]() -> Result<void> {
    if (auto r = sqlite::exec(db, kTasksV3); !r) {
      return r;
    }
    if (auto r = sqlite::exec(db, kIndexes); !r) {
      return r;
    }
    return set_user_version(db, kCurrentVersion);
  });
}

// v1 -> v2: SQLite cannot alter a CHECK constraint, so the table is rebuilt
// through a backup copy.
auto rebuild_with_wider_status(sqlite3* db) -> Result<void> {
  return in_transaction(db, [db]() -> Result<void> {
    auto before = count_rows(db, kTasksTable);
    if (!before) {
      return std::unexpected(before.error());
    }
    for (auto sql : {kDropIndexes,
                     std::string_view{"ALTER TABLE tasks RENAME TO tasks_backup;"},
                     kTasksV2}) {
      if (auto r = sqlite::exec(db, sql); !r) {
        return r;
      }
    }
    if (auto r = sqlite::exec(
            db, std::format("INSERT INTO tasks ({0}) SELECT {0} FROM {1};",
                            kLegacyColumns, kBackupTable));
        !r) {
      return r;
    }
    auto after = count_rows(db, kTasksTable);
    if (!after) {
      return std::unexpected(after.error());
    }
    if (*after != *before) {
      log::error("Migration copied {} of {} task rows, rolling back", *after,
                 *before);
      return fail(Error::DatabaseError);
    }
    if (auto r = sqlite::exec(db, "DROP TABLE tasks_backup;"); !r) {
      return r;
    }
    if (auto r = sqlite::exec(db, kIndexes); !r) {
      return r;
    }
    return set_user_version(db, 2);
  });
}

auto add_outcome_columns(sqlite3* db) -> Result<void> {
  return in_transaction(db, [db]() -> Result<void> {
    if (auto r = sqlite::exec(db, "ALTER TABLE tasks ADD COLUMN error_code TEXT;");
        !r) {
      return r;
    }
    if (auto r =
            sqlite::exec(db, "ALTER TABLE tasks ADD COLUMN exit_code INTEGER;");
        !r) {
      return r;
    }
    return set_user_version(db, 3);
  });
}

struct Migration {
  int from;
  std::string_view description;
  Result<void> (*apply)(sqlite3*);
};

constexpr std::array<Migration, 2> kMigrations = {{
    {1, "widen status constraint", rebuild_with_wider_status},
    {2, "add error_code and exit_code", add_outcome_columns},
}};

}  // namespace

auto user_version(sqlite3* db) -> Result<int> {
  auto stmt = sqlite::prepare(db, "PRAGMA user_version;");
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  int rc = sqlite3_step(stmt->get());
  if (rc != SQLITE_ROW) {
    return fail(sqlite::error_from(rc));
  }
  return static_cast<int>(stmt->int64(0));
}

auto restore_backup(sqlite3* db) -> Result<bool> {
  auto backup = sqlite::table_exists(db, kBackupTable);
  if (!backup) {
    return std::unexpected(backup.error());
  }
  if (!*backup) {
    return false;
  }
  log::warn("Found {} left by an interrupted migration, restoring it",
            kBackupTable);

  auto restored = in_transaction(db, [db]() -> Result<void> {
    auto tasks = sqlite::table_exists(db, kTasksTable);
    if (!tasks) {
      return std::unexpected(tasks.error());
    }
    if (*tasks) {
      if (auto r = sqlite::exec(db, "DROP TABLE tasks;"); !r) {
        return r;
      }
    }
    if (auto r = sqlite::exec(db, "ALTER TABLE tasks_backup RENAME TO tasks;");
        !r) {
      return r;
    }
    auto version = detect_version(db);
    if (!version) {
      return std::unexpected(version.error());
    }
    return set_user_version(db, *version);
  });
  if (!restored) {
    return std::unexpected(restored.error());
  }
  return true;
}

auto migrate(sqlite3* db) -> Result<int> {
  if (auto r = restore_backup(db); !r) {
    return std::unexpected(r.error());
  }

  auto exists = sqlite::table_exists(db, kTasksTable);
  if (!exists) {
    return std::unexpected(exists.error());
  }
  if (!*exists) {
    if (auto r = create_fresh(db); !r) {
      return std::unexpected(r.error());
    }
    log::debug("Created tasks table at schema version {}", kCurrentVersion);
    return 0;
  }

  auto found = user_version(db);
  if (!found) {
    return std::unexpected(found.error());
  }
  int version = *found;
  if (version == 0) {
    // Databases written before versioning carry a table but no user_version.
    auto detected = detect_version(db);
    if (!detected) {
      return std::unexpected(detected.error());
    }
    version = *detected;
  }
  if (version > kCurrentVersion) {
    log::error("Database schema version {} is newer than supported version {}",
               version, kCurrentVersion);
    return fail(Error::DatabaseError);
  }

  const int original = version;
  for (const auto& m : kMigrations) {
    if (m.from != version) {
      continue;
    }
    log::info("Migrating tasks schema v{} -> v{}: {}", m.from, m.from + 1,
              m.description);
    if (auto r = m.apply(db); !r) {
      log::error("Migration from v{} failed: {}", m.from, r.error().message());
      return std::unexpected(r.error());
    }
    version = m.from + 1;
  }
  if (auto r = sqlite::exec(db, kIndexes); !r) {
    return std::unexpected(r.error());
  }
  if (original == version && *found == 0) {
    if (auto r = set_user_version(db, version); !r) {
      return std::unexpected(r.error());
    }
  }
  return original;
}

}  // namespace taskwarden::schema
