#include "taskwarden/storage/task_registry.hpp"

#include "taskwarden/storage/schema.hpp"
#include "taskwarden/storage/state_strings.hpp"
#include "taskwarden/util/log.hpp"
#include "taskwarden/util/time.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <thread>
#include <type_traits>
#include <variant>

namespace taskwarden {

namespace {

using json = nlohmann::json;

constexpr std::string_view kSelect = R"(
  SELECT id, external_id, alias, origin, status, instruction, working_dir,
         env_id, mode, model, created_at, updated_at, completed_at,
         last_event_at, progress_steps, poll_frequency_ms, keep_alive_until,
         thread_id, user_id, result, error, metadata, error_code, exit_code
  FROM tasks)";

constexpr std::string_view kTerminalStatuses =
    "('completed', 'completed_with_warnings', 'completed_with_errors', "
    "'failed', 'canceled', 'unknown')";

auto parse_json_column(const std::optional<std::string>& text)
    -> std::optional<json> {
  if (!text || text->empty()) {
    return std::nullopt;
  }
  auto parsed = json::parse(*text, nullptr, false);
  if (parsed.is_discarded()) {
    // Rows from older layouts stored plain strings.
    return json(*text);
  }
  return parsed;
}

// Invalid UTF-8 in worker text is stored as U+FFFD rather than throwing.
auto dump_text(const json& value) -> std::string {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto dump_json(const std::optional<json>& value) -> std::optional<std::string> {
  if (!value || value->is_null()) {
    return std::nullopt;
  }
  return dump_text(*value);
}

auto row_to_task(const sqlite::Statement& stmt) -> Task {
  Task t;
  t.id = TaskId{stmt.text(0)};
  t.external_id = stmt.optional_text(1);
  t.alias = stmt.optional_text(2);
  t.origin = parse_task_origin(stmt.text(3)).value_or(TaskOrigin::Local);
  auto status_text = stmt.text(4);
  if (auto status = parse_task_status(status_text)) {
    t.status = *status;
  } else {
    log::warn("Task {} has unrecognised status '{}'", t.id, status_text);
    t.status = TaskStatus::Unknown;
  }
  t.instruction = stmt.text(5);
  t.working_dir = stmt.text(6);
  t.env_id = stmt.optional_text(7);
  t.mode = stmt.optional_text(8);
  t.model = stmt.optional_text(9);
  t.created_at = stmt.int64(10);
  t.updated_at = stmt.int64(11);
  t.completed_at = stmt.optional_int64(12);
  t.last_event_at = stmt.optional_int64(13);
  t.progress = parse_json_column(stmt.optional_text(14));
  if (t.progress && !t.progress->is_object()) {
    t.progress.reset();
  }
  t.poll_frequency_ms = stmt.optional_int64(15);
  t.keep_alive_until = stmt.optional_int64(16);
  t.thread_id = stmt.optional_text(17);
  t.user_id = stmt.optional_text(18);
  t.result = parse_json_column(stmt.optional_text(19));
  t.error = parse_json_column(stmt.optional_text(20));
  if (auto meta = parse_json_column(stmt.optional_text(21));
      meta && meta->is_object()) {
    t.metadata = std::move(*meta);
  }
  t.error_code = stmt.optional_text(22);
  if (auto code = stmt.optional_int64(23)) {
    t.exit_code = static_cast<int>(*code);
  }
  return t;
}

auto fetch(sqlite3* db, const TaskId& id) -> Result<Task> {
  auto stmt = sqlite::prepare(db, std::format("{} WHERE id = ?;", kSelect));
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  stmt->bind_text(1, id.value());
  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_ROW) {
    return row_to_task(*stmt);
  }
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  return fail(sqlite::error_from(rc));
}

auto fetch_all(sqlite::Statement& stmt) -> Result<std::vector<Task>> {
  std::vector<Task> tasks;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    tasks.push_back(row_to_task(stmt));
  }
  if (rc != SQLITE_DONE) {
    return fail(sqlite::error_from(rc));
  }
  return tasks;
}

auto step_done(sqlite3* db, sqlite::Statement& stmt) -> Result<void> {
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    log::error("SQL step failed: {}", sqlite3_errmsg(db));
    return fail(sqlite::error_from(rc));
  }
  return ok();
}

// Writes every mutable column of `task`.
auto store(sqlite3* db, const Task& task) -> Result<void> {
  constexpr std::string_view sql = R"(
    UPDATE tasks SET
      external_id = ?1, alias = ?2, status = ?3, working_dir = ?4,
      env_id = ?5, mode = ?6, model = ?7, updated_at = ?8,
      completed_at = ?9, last_event_at = ?10, progress_steps = ?11,
      poll_frequency_ms = ?12, keep_alive_until = ?13, thread_id = ?14,
      user_id = ?15, result = ?16, error = ?17, metadata = ?18,
      error_code = ?19, exit_code = ?20
    WHERE id = ?21;
  )";
  auto stmt = sqlite::prepare(db, sql);
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  stmt->bind_optional(1, task.external_id);
  stmt->bind_optional(2, task.alias);
  stmt->bind_text(3, task_status_name(task.status));
  stmt->bind_text(4, task.working_dir);
  stmt->bind_optional(5, task.env_id);
  stmt->bind_optional(6, task.mode);
  stmt->bind_optional(7, task.model);
  stmt->bind_int64(8, task.updated_at);
  stmt->bind_optional(9, task.completed_at);
  stmt->bind_optional(10, task.last_event_at);
  stmt->bind_optional(11, dump_json(task.progress));
  stmt->bind_optional(12, task.poll_frequency_ms);
  stmt->bind_optional(13, task.keep_alive_until);
  stmt->bind_optional(14, task.thread_id);
  stmt->bind_optional(15, task.user_id);
  stmt->bind_optional(16, dump_json(task.result));
  stmt->bind_optional(17, dump_json(task.error));
  stmt->bind_text(18, dump_text(task.metadata));
  stmt->bind_optional(19, task.error_code);
  stmt->bind_optional(20, task.exit_code);
  stmt->bind_text(21, task.id.value());
  return step_done(db, *stmt);
}

auto apply_patch(Task& task, const TaskPatch& patch) -> void {
  auto assign = [](auto& field, const auto& value) {
    if (value) {
      field = *value;
    }
  };
  assign(task.external_id, patch.external_id);
  assign(task.alias, patch.alias);
  assign(task.thread_id, patch.thread_id);
  assign(task.progress, patch.progress);
  assign(task.last_event_at, patch.last_event_at);
  assign(task.poll_frequency_ms, patch.poll_frequency_ms);
  assign(task.keep_alive_until, patch.keep_alive_until);
  assign(task.result, patch.result);
  assign(task.error, patch.error);
  assign(task.error_code, patch.error_code);
  assign(task.exit_code, patch.exit_code);
  if (patch.metadata) {
    if (patch.metadata->is_object()) {
      for (const auto& [k, v] : patch.metadata->items()) {
        task.metadata[k] = v;
      }
    } else {
      log::warn("Ignoring non-object metadata patch for task {}", task.id);
    }
  }
}

// updated_at never moves backwards, even across a wall-clock step.
auto touch(Task& task) -> void {
  task.updated_at = std::max(now_ms(), task.updated_at);
}

constexpr auto can_transition(TaskStatus from, TaskStatus to) noexcept
    -> bool {
  if (is_terminal(from) || to == TaskStatus::Pending ||
      to == TaskStatus::Unknown) {
    return false;
  }
  if (from == TaskStatus::Pending) {
    return to == TaskStatus::Working || to == TaskStatus::Failed ||
           to == TaskStatus::Canceled;
  }
  return true;
}

auto is_expected_error(const std::error_code& ec) -> bool {
  return ec == Error::NotFound || ec == Error::InvalidTransition ||
         ec == Error::InvalidArgument || ec == Error::AlreadyExists;
}

}  // namespace

TaskRegistry::TaskRegistry(RegistryOptions options)
    : options_(std::move(options)) {
}

TaskRegistry::~TaskRegistry() {
  close();
}

auto TaskRegistry::open() -> Result<void> {
  if (writer_) {
    return ok();
  }

  auto writer = sqlite::open(options_.db_path, options_.busy_timeout_ms);
  if (!writer) {
    return std::unexpected(writer.error());
  }

  // PRAGMA statements may fail on some filesystems; the registry still works
  // without WAL, only with more contention.
  if (auto r = sqlite::exec(writer->get(), "PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = sqlite::exec(writer->get(), "PRAGMA synchronous=NORMAL;");
      !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  auto from = schema::migrate(writer->get());
  if (!from) {
    log::error("Failed to prepare task schema in {}: {}", options_.db_path,
               from.error().message());
    return std::unexpected(from.error());
  }

  if (options_.db_path != ":memory:") {
    auto reader = sqlite::open(options_.db_path, options_.busy_timeout_ms);
    if (!reader) {
      return std::unexpected(reader.error());
    }
    if (auto r = sqlite::exec(reader->get(), "PRAGMA query_only = ON;"); !r) {
      log::warn("Failed to make reader connection read-only: {}",
                r.error().message());
    }
    reader_ = std::move(*reader);
  }
  writer_ = std::move(*writer);

  log::info("Task registry opened: {} (schema v{} -> v{})", options_.db_path,
            *from, schema::kCurrentVersion);
  return ok();
}

auto TaskRegistry::close() -> void {
  std::scoped_lock lock(write_mu_, read_mu_);
  reader_.reset();
  writer_.reset();
}

template <typename T, typename Fn>
auto TaskRegistry::write(std::string_view what, Fn&& body) -> Result<T> {
  std::lock_guard lock(write_mu_);
  if (!writer_) {
    return fail(Error::DatabaseError);
  }
  auto* db = writer_.get();

  auto attempt = [&]() -> Result<T> {
    if (auto r = sqlite::exec(db, "BEGIN IMMEDIATE;"); !r) {
      return std::unexpected(r.error());
    }
    Result<T> result = fail(Error::DatabaseError);
    try {
      result = body(db);
    } catch (const nlohmann::json::exception& e) {
      log::error("{} could not encode its row: {}", what, e.what());
    }
    if (result) {
      if (auto c = sqlite::exec(db, "COMMIT;"); c) {
        return result;
      } else {
        result = std::unexpected(c.error());
      }
    }
    if (sqlite3_get_autocommit(db) == 0) {
      if (auto rb = sqlite::exec(db, "ROLLBACK;"); !rb) {
        log::error("Rollback of {} failed: {}", what, rb.error().message());
      }
    }
    return result;
  };

  auto result = attempt();
  if (!result && result.error() == Error::DatabaseBusy) {
    log::warn("{} hit a busy database, retrying in {}ms", what,
              options_.write_retry_delay.count());
    std::this_thread::sleep_for(options_.write_retry_delay);
    result = attempt();
  }
  if (!result && !is_expected_error(result.error())) {
    log::error("{} failed: {}", what, result.error().message());
  }
  return result;
}

template <typename T, typename Fn>
auto TaskRegistry::read(Fn&& body) -> Result<T> {
  if (reader_) {
    std::lock_guard lock(read_mu_);
    return body(reader_.get());
  }
  std::lock_guard lock(write_mu_);
  if (!writer_) {
    return fail(Error::DatabaseError);
  }
  return body(writer_.get());
}

auto TaskRegistry::register_task(const TaskParams& params) -> Result<Task> {
  if (params.instruction.empty()) {
    return fail(Error::InvalidArgument);
  }

  Task task;
  task.id = params.id.value_or(
      generate_task_id(task_origin_name(params.origin)));
  task.origin = params.origin;
  task.instruction = params.instruction;
  task.working_dir = params.working_dir;
  if (task.working_dir.empty()) {
    std::error_code ec;
    task.working_dir = std::filesystem::current_path(ec).string();
  }
  task.external_id = params.external_id;
  task.alias = params.alias;
  task.env_id = params.env_id;
  task.mode = params.mode;
  task.model = params.model;
  task.thread_id = params.thread_id;
  task.user_id = params.user_id;
  task.poll_frequency_ms = params.poll_frequency_ms;
  if (params.metadata.is_object()) {
    task.metadata = params.metadata;
  }
  task.created_at = now_ms();
  task.updated_at = task.created_at;

  return write<Task>("register_task", [&](sqlite3* db) -> Result<Task> {
    constexpr std::string_view sql = R"(
      INSERT INTO tasks (
        id, external_id, alias, origin, status, instruction, working_dir,
        env_id, mode, model, created_at, updated_at, poll_frequency_ms,
        thread_id, user_id, metadata
      ) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14,
                ?15, ?16);
    )";
    auto stmt = sqlite::prepare(db, sql);
    if (!stmt) {
      return std::unexpected(stmt.error());
    }
    stmt->bind_text(1, task.id.value());
    stmt->bind_optional(2, task.external_id);
    stmt->bind_optional(3, task.alias);
    stmt->bind_text(4, task_origin_name(task.origin));
    stmt->bind_text(5, task_status_name(TaskStatus::Pending));
    stmt->bind_text(6, task.instruction);
    stmt->bind_text(7, task.working_dir);
    stmt->bind_optional(8, task.env_id);
    stmt->bind_optional(9, task.mode);
    stmt->bind_optional(10, task.model);
    stmt->bind_int64(11, task.created_at);
    stmt->bind_int64(12, task.updated_at);
    stmt->bind_optional(13, task.poll_frequency_ms);
    stmt->bind_optional(14, task.thread_id);
    stmt->bind_optional(15, task.user_id);
    stmt->bind_text(16, dump_text(task.metadata));

    int rc = sqlite3_step(stmt->get());
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
      log::warn("Task {} already exists", task.id);
      return fail(Error::AlreadyExists);
    }
    if (rc != SQLITE_DONE) {
      log::error("Failed to insert task {}: {}", task.id, sqlite3_errmsg(db));
      return fail(sqlite::error_from(rc));
    }
    log::debug("Registered task {}", task.id);
    return task;
  });
}

auto TaskRegistry::update_status(const TaskId& id, TaskStatus status,
                                 const TaskPatch& patch) -> Result<Task> {
  return write<Task>("update_status", [&](sqlite3* db) -> Result<Task> {
    auto current = fetch(db, id);
    if (!current) {
      return current;
    }
    if (current->status == status) {
      return current;
    }
    if (!can_transition(current->status, status)) {
      log::warn("Rejected transition of task {} from {} to {}", id,
                task_status_name(current->status), task_status_name(status));
      return fail(Error::InvalidTransition);
    }

    Task task = std::move(*current);
    apply_patch(task, patch);
    task.status = status;
    touch(task);
    if (is_terminal(status)) {
      task.completed_at = task.updated_at;
    }
    if (auto r = store(db, task); !r) {
      return std::unexpected(r.error());
    }
    log::debug("Task {} -> {}", id, task_status_name(status));
    return task;
  });
}

auto TaskRegistry::update_task(const TaskId& id, const TaskPatch& patch)
    -> Result<Task> {
  return write<Task>("update_task", [&](sqlite3* db) -> Result<Task> {
    auto current = fetch(db, id);
    if (!current) {
      return current;
    }
    Task task = std::move(*current);
    apply_patch(task, patch);
    touch(task);
    if (auto r = store(db, task); !r) {
      return std::unexpected(r.error());
    }
    return task;
  });
}

auto TaskRegistry::update_progress(const TaskId& id, const json& summary)
    -> Result<Task> {
  return write<Task>("update_progress", [&](sqlite3* db) -> Result<Task> {
    auto current = fetch(db, id);
    if (!current || current->terminal()) {
      return current;
    }
    Task task = std::move(*current);
    touch(task);
    task.progress = summary;
    task.last_event_at = task.updated_at;
    if (auto r = store(db, task); !r) {
      return std::unexpected(r.error());
    }
    return task;
  });
}

auto TaskRegistry::mark_unknown(const TaskId& id, std::string_view reason)
    -> Result<Task> {
  return write<Task>("mark_unknown", [&](sqlite3* db) -> Result<Task> {
    auto current = fetch(db, id);
    if (!current) {
      return current;
    }
    if (current->terminal()) {
      return fail(Error::InvalidTransition);
    }
    Task task = std::move(*current);
    task.status = TaskStatus::Unknown;
    touch(task);
    task.completed_at = task.updated_at;
    task.error = json{{"code", "UNKNOWN_ERROR"}, {"message", reason}};
    task.error_code = "UNKNOWN_ERROR";
    if (auto r = store(db, task); !r) {
      return std::unexpected(r.error());
    }
    log::warn("Task {} marked unknown: {}", id, reason);
    return task;
  });
}

auto TaskRegistry::get(const TaskId& id) -> Result<Task> {
  return read<Task>([&](sqlite3* db) { return fetch(db, id); });
}

auto TaskRegistry::resolve(std::string_view id_or_alias) -> Result<Task> {
  if (auto task = get(TaskId{std::string{id_or_alias}});
      task || task.error() != Error::NotFound) {
    return task;
  }
  return read<Task>([&](sqlite3* db) -> Result<Task> {
    auto stmt = sqlite::prepare(
        db, std::format("{} WHERE alias = ? ORDER BY created_at DESC LIMIT 1;",
                        kSelect));
    if (!stmt) {
      return std::unexpected(stmt.error());
    }
    stmt->bind_text(1, id_or_alias);
    int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_ROW) {
      return row_to_task(*stmt);
    }
    if (rc == SQLITE_DONE) {
      return fail(Error::NotFound);
    }
    return fail(sqlite::error_from(rc));
  });
}

auto TaskRegistry::query(const TaskFilter& filter)
    -> Result<std::vector<Task>> {
  using Param = std::variant<std::string, std::int64_t>;
  std::string sql{kSelect};
  sql += " WHERE 1=1";
  std::vector<Param> params;

  auto add = [&](std::string_view clause, Param value) {
    sql += clause;
    params.push_back(std::move(value));
  };
  if (filter.origin) {
    add(" AND origin = ?", std::string{task_origin_name(*filter.origin)});
  }
  if (filter.status) {
    add(" AND status = ?", std::string{task_status_name(*filter.status)});
  }
  if (filter.working_dir) {
    add(" AND working_dir = ?", *filter.working_dir);
  }
  if (filter.env_id) {
    add(" AND env_id = ?", *filter.env_id);
  }
  if (filter.thread_id) {
    add(" AND thread_id = ?", *filter.thread_id);
  }
  if (filter.user_id) {
    add(" AND user_id = ?", *filter.user_id);
  }
  if (filter.created_after) {
    add(" AND created_at >= ?", *filter.created_after);
  }
  if (filter.created_before) {
    add(" AND created_at <= ?", *filter.created_before);
  }
  sql += " ORDER BY created_at DESC, id DESC";
  if (filter.limit || filter.offset > 0) {
    add(" LIMIT ?", filter.limit ? static_cast<std::int64_t>(*filter.limit)
                                 : std::int64_t{-1});
    add(" OFFSET ?", static_cast<std::int64_t>(filter.offset));
  }
  sql += ";";

  return read<std::vector<Task>>(
      [&](sqlite3* db) -> Result<std::vector<Task>> {
        auto stmt = sqlite::prepare(db, sql);
        if (!stmt) {
          return std::unexpected(stmt.error());
        }
        for (int i = 0; i < static_cast<int>(params.size()); ++i) {
          std::visit(
              [&](const auto& v) {
                if constexpr (std::is_same_v<std::decay_t<decltype(v)>,
                                             std::string>) {
                  stmt->bind_text(i + 1, v);
                } else {
                  stmt->bind_int64(i + 1, v);
                }
              },
              params[static_cast<std::size_t>(i)]);
        }
        return fetch_all(*stmt);
      });
}

auto TaskRegistry::delete_task(const TaskId& id) -> Result<bool> {
  return write<bool>("delete_task", [&](sqlite3* db) -> Result<bool> {
    auto stmt = sqlite::prepare(db, "DELETE FROM tasks WHERE id = ?;");
    if (!stmt) {
      return std::unexpected(stmt.error());
    }
    stmt->bind_text(1, id.value());
    if (auto r = step_done(db, *stmt); !r) {
      return std::unexpected(r.error());
    }
    return sqlite3_changes(db) > 0;
  });
}

auto TaskRegistry::reclaim_stuck(std::int64_t max_age_seconds)
    -> Result<std::size_t> {
  auto now = now_ms();
  auto cutoff = now - max_age_seconds * 1000;
  auto count = write<std::size_t>(
      "reclaim_stuck", [&](sqlite3* db) -> Result<std::size_t> {
        // Both timestamps read the pre-update updated_at, so completed_at
        // ends up equal to updated_at.
        constexpr std::string_view sql = R"(
          UPDATE tasks SET
            status = 'failed',
            updated_at = MAX(updated_at, ?1),
            completed_at = MAX(updated_at, ?1),
            error_code = 'TIMEOUT',
            error = '{"code":"TIMEOUT","message":"Task was still ' || status ||
                    ' more than ' || ?2 ||
                    ' seconds after creation and was reclaimed as stuck"}'
          WHERE status IN ('pending', 'working') AND created_at < ?3;
        )";
        auto stmt = sqlite::prepare(db, sql);
        if (!stmt) {
          return std::unexpected(stmt.error());
        }
        stmt->bind_int64(1, now);
        stmt->bind_int64(2, max_age_seconds);
        stmt->bind_int64(3, cutoff);
        if (auto r = step_done(db, *stmt); !r) {
          return std::unexpected(r.error());
        }
        return static_cast<std::size_t>(sqlite3_changes(db));
      });
  if (count && *count > 0) {
    log::info("Reclaimed {} stuck task(s) older than {}s", *count,
              max_age_seconds);
  }
  return count;
}

auto TaskRegistry::prune_old(std::chrono::milliseconds max_age)
    -> Result<std::size_t> {
  auto now = now_ms();
  auto cutoff = now - max_age.count();
  auto count = write<std::size_t>(
      "prune_old", [&](sqlite3* db) -> Result<std::size_t> {
        auto stmt = sqlite::prepare(
            db, std::format(R"(
              DELETE FROM tasks
              WHERE status IN {}
                AND completed_at IS NOT NULL
                AND completed_at < ?1
                AND (keep_alive_until IS NULL OR keep_alive_until < ?2);
            )",
                            kTerminalStatuses));
        if (!stmt) {
          return std::unexpected(stmt.error());
        }
        stmt->bind_int64(1, cutoff);
        stmt->bind_int64(2, now);
        if (auto r = step_done(db, *stmt); !r) {
          return std::unexpected(r.error());
        }
        return static_cast<std::size_t>(sqlite3_changes(db));
      });
  if (count && *count > 0) {
    log::info("Pruned {} finished task(s)", *count);
  }
  return count;
}

auto TaskRegistry::stats() -> Result<RegistryStats> {
  return read<RegistryStats>([](sqlite3* db) -> Result<RegistryStats> {
    RegistryStats stats;
    auto group = [db](std::string_view column,
                      std::map<std::string, std::size_t, std::less<>>& out)
        -> Result<std::size_t> {
      auto stmt = sqlite::prepare(
          db, std::format("SELECT {0}, COUNT(*) FROM tasks GROUP BY {0};",
                          column));
      if (!stmt) {
        return std::unexpected(stmt.error());
      }
      std::size_t total = 0;
      int rc = SQLITE_OK;
      while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        auto n = static_cast<std::size_t>(stmt->int64(1));
        out[stmt->text(0)] = n;
        total += n;
      }
      if (rc != SQLITE_DONE) {
        return fail(sqlite::error_from(rc));
      }
      return total;
    };
    auto total = group("status", stats.by_status);
    if (!total) {
      return std::unexpected(total.error());
    }
    if (auto r = group("origin", stats.by_origin); !r) {
      return std::unexpected(r.error());
    }
    stats.total = *total;
    for (auto name : {"pending", "working"}) {
      if (auto it = stats.by_status.find(name); it != stats.by_status.end()) {
        stats.running += it->second;
      }
    }
    return stats;
  });
}

auto TaskRegistry::schema_version() -> Result<int> {
  return read<int>([](sqlite3* db) { return schema::user_version(db); });
}

}  // namespace taskwarden
