#pragma once

#include "cintel/core/result.h"

#include <memory>
#include <mutex>
#include <string>

// Forward declared so the SQLite header stays out of the public API.
struct sqlite3;
struct sqlite3_stmt;

namespace cintel::storage::sqlite {

// SqliteDb owns one SQLite connection and applies the embedded schema.
// Stores sharing a SqliteDb serialize their statements through mutex().
class SqliteDb {
 public:
  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;
  ~SqliteDb() = default;

  // 0 when no schema has been applied.
  [[nodiscard]] int get_schema_version() const;

  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }
  [[nodiscard]] std::mutex& mutex() const { return mutex_; }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
  mutable std::mutex mutex_;
};

// RAII prepared statement.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;
  ~PreparedStatement() = default;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Binds text by copy (SQLITE_TRANSIENT); index is 1-based.
  void bind_text(int index, const std::string& value) const;
  void bind_int64(int index, long long value) const;
  void bind_null(int index) const;

  // Column text, "" for NULL.
  [[nodiscard]] std::string column_text(int index) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace cintel::storage::sqlite
