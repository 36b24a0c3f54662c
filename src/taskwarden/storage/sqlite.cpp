#include "taskwarden/storage/sqlite.hpp"

#include "taskwarden/util/log.hpp"

#include <sqlite3.h>

namespace taskwarden::sqlite {

auto DbDeleter::operator()(sqlite3* db) const -> void {
  if (db) {
    sqlite3_close_v2(db);
  }
}

Statement::~Statement() {
  reset();
}

auto Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto Statement::bind_text(int idx, std::string_view value) -> void {
  // A null data pointer would bind SQL NULL instead of ''.
  sqlite3_bind_text(stmt_, idx, value.data() ? value.data() : "",
                    static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

auto Statement::bind_int64(int idx, std::int64_t value) -> void {
  sqlite3_bind_int64(stmt_, idx, value);
}

auto Statement::bind_optional(int idx, const std::optional<std::string>& value)
    -> void {
  if (value) {
    bind_text(idx, *value);
  } else {
    bind_null(idx);
  }
}

auto Statement::bind_optional(int idx, const std::optional<std::int64_t>& value)
    -> void {
  if (value) {
    bind_int64(idx, *value);
  } else {
    bind_null(idx);
  }
}

auto Statement::bind_optional(int idx, const std::optional<int>& value) -> void {
  if (value) {
    sqlite3_bind_int(stmt_, idx, *value);
  } else {
    bind_null(idx);
  }
}

auto Statement::bind_null(int idx) -> void {
  sqlite3_bind_null(stmt_, idx);
}

auto Statement::text(int col) const -> std::string {
  const auto* p =
      reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
  if (!p) {
    return {};
  }
  return {p, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col))};
}

auto Statement::optional_text(int col) const -> std::optional<std::string> {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return text(col);
}

auto Statement::int64(int col) const -> std::int64_t {
  return sqlite3_column_int64(stmt_, col);
}

auto Statement::optional_int64(int col) const -> std::optional<std::int64_t> {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return int64(col);
}

auto error_from(int rc) -> std::error_code {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_IOERR:
      return make_error_code(Error::DatabaseBusy);
    default:
      return make_error_code(Error::DatabaseQueryFailed);
  }
}

auto open(std::string_view path, int busy_timeout_ms) -> Result<Database> {
  sqlite3* raw_db = nullptr;
  std::string path_str{path};
  int rc = sqlite3_open_v2(
      path_str.c_str(), &raw_db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  Database db{raw_db};
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", path,
               raw_db ? sqlite3_errmsg(raw_db) : sqlite3_errstr(rc));
    return fail(Error::DatabaseOpenFailed);
  }
  sqlite3_busy_timeout(db.get(), busy_timeout_ms);
  sqlite3_extended_result_codes(db.get(), 1);
  return db;
}

auto exec(sqlite3* db, std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db, sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : sqlite3_errstr(rc));
    sqlite3_free(err_msg);
    return fail(error_from(rc));
  }
  return ok();
}

auto prepare(sqlite3* db, std::string_view sql) -> Result<Statement> {
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()),
                              &stmt, nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db));
    return fail(error_from(rc));
  }
  return Statement{stmt};
}

auto table_exists(sqlite3* db, std::string_view name) -> Result<bool> {
  auto stmt = prepare(
      db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
  if (!stmt) {
    return std::unexpected(stmt.error());
  }
  stmt->bind_text(1, name);
  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  return fail(error_from(rc));
}

}  // namespace taskwarden::sqlite
