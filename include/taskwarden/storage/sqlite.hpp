#pragma once

#include "taskwarden/core/error.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace taskwarden::sqlite {

struct DbDeleter {
  void operator()(sqlite3* db) const;
};

using Database = std::unique_ptr<sqlite3, DbDeleter>;

class Statement {
public:
  explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
  }
  ~Statement();
  Statement(Statement&& other) noexcept
      : stmt_(std::exchange(other.stmt_, nullptr)) {
  }
  Statement& operator=(Statement&& other) noexcept {
    if (this != &other) {
      reset();
      stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
    return stmt_;
  }
  [[nodiscard]] explicit operator bool() const noexcept {
    return stmt_ != nullptr;
  }
  auto reset() -> void;

  // 1-based binders; an empty optional binds NULL.
  auto bind_text(int idx, std::string_view value) -> void;
  auto bind_int64(int idx, std::int64_t value) -> void;
  auto bind_optional(int idx, const std::optional<std::string>& value) -> void;
  auto bind_optional(int idx, const std::optional<std::int64_t>& value)
      -> void;
  auto bind_optional(int idx, const std::optional<int>& value) -> void;
  auto bind_null(int idx) -> void;

  // 0-based column readers.
  [[nodiscard]] auto text(int col) const -> std::string;
  [[nodiscard]] auto optional_text(int col) const
      -> std::optional<std::string>;
  [[nodiscard]] auto int64(int col) const -> std::int64_t;
  [[nodiscard]] auto optional_int64(int col) const
      -> std::optional<std::int64_t>;

private:
  sqlite3_stmt* stmt_ = nullptr;
};

// SQLITE_BUSY, SQLITE_LOCKED and SQLITE_IOERR (with extended codes) map to
// Error::DatabaseBusy; everything else to Error::DatabaseQueryFailed.
[[nodiscard]] auto error_from(int rc) -> std::error_code;

[[nodiscard]] auto open(std::string_view path, int busy_timeout_ms)
    -> Result<Database>;
[[nodiscard]] auto exec(sqlite3* db, std::string_view sql) -> Result<void>;
[[nodiscard]] auto prepare(sqlite3* db, std::string_view sql)
    -> Result<Statement>;

[[nodiscard]] auto table_exists(sqlite3* db, std::string_view name)
    -> Result<bool>;

}  // namespace taskwarden::sqlite
