#include "cintel/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace cintel::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

namespace {

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS documents (
  document_id TEXT PRIMARY KEY,
  filename TEXT,
  extraction_method TEXT NOT NULL,
  content_hash TEXT NOT NULL,
  warnings_json TEXT NOT NULL,
  ingested_at TEXT
);

CREATE TABLE IF NOT EXISTS pages (
  document_id TEXT NOT NULL,
  page_number INTEGER NOT NULL,
  text TEXT NOT NULL,
  PRIMARY KEY(document_id, page_number),
  FOREIGN KEY(document_id) REFERENCES documents(document_id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS trace_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  refs_json TEXT NOT NULL,
  seq INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_trace_events_trace ON trace_events(trace_id, seq);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

std::string take_error(char* err_msg) {
  std::string error = err_msg != nullptr ? err_msg : "Unknown error";
  sqlite3_free(err_msg);
  return error;
}

}  // namespace

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
    const std::string error = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    sqlite3_close(raw);
    return OpenResult::err("Failed to open database: " + error);
  }
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));

  char* err_msg = nullptr;
  if (sqlite3_exec(raw, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
    return OpenResult::err("Failed to enable foreign keys: " + take_error(err_msg));
  }
  sqlite3_busy_timeout(raw, 5000);

  return OpenResult::ok(std::move(db));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // schema_version does not exist yet
  }
  return sqlite3_step(stmt.get()) == SQLITE_ROW ? sqlite3_column_int(stmt.get(), 0) : 0;
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }
  char* err_msg = nullptr;
  if (sqlite3_exec(db_.get(), kSchemaV1, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " +
                                                take_error(err_msg));
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
    return core::Result<bool, std::string>::err("SQL execution failed: " + take_error(err_msg));
  }
  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

void PreparedStatement::bind_text(const int index, const std::string& value) const {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

void PreparedStatement::bind_int64(const int index, const long long value) const {
  sqlite3_bind_int64(stmt_.get(), index, value);
}

void PreparedStatement::bind_null(const int index) const {
  sqlite3_bind_null(stmt_.get(), index);
}

std::string PreparedStatement::column_text(const int index) const {
  const unsigned char* raw = sqlite3_column_text(stmt_.get(), index);
  if (raw == nullptr) {
    return {};
  }
  const int bytes = sqlite3_column_bytes(stmt_.get(), index);
  return std::string(reinterpret_cast<const char*>(raw), static_cast<std::size_t>(bytes));  // NOLINT
}

}  // namespace cintel::storage::sqlite
