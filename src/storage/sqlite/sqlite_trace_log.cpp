#include "cintel/storage/sqlite/sqlite_trace_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <iostream>

namespace cintel::storage::sqlite {

SqliteTraceLog::SqliteTraceLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteTraceLog::append(const TraceEvent& event) {
  std::lock_guard<std::mutex> lock(db_->mutex());

  // seq continues the trace's sequence so query() can replay append order.
  PreparedStatement stmt(db_->connection(),
                         "INSERT INTO trace_events"
                         " (event_id, trace_id, event_type, payload, created_at, refs_json, seq)"
                         " VALUES (?, ?, ?, ?, ?, ?,"
                         "  (SELECT COALESCE(MAX(seq), -1) + 1 FROM trace_events"
                         "   WHERE trace_id = ?))");
  if (!stmt.is_valid()) {
    std::cerr << "WARNING: trace event " << event.event_id
              << " not persisted: " << stmt.error() << "\n";
    return;
  }
  stmt.bind_text(1, event.event_id);
  stmt.bind_text(2, event.trace_id);
  stmt.bind_text(3, event.event_type);
  stmt.bind_text(4, event.payload);
  stmt.bind_text(5, event.created_at);
  stmt.bind_text(6, nlohmann::json(event.refs).dump());
  stmt.bind_text(7, event.trace_id);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    std::cerr << "WARNING: trace event " << event.event_id
              << " not persisted: " << sqlite3_errmsg(db_->connection()) << "\n";
  }
}

std::vector<TraceEvent> SqliteTraceLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "SELECT event_id, trace_id, event_type, payload, created_at, refs_json"
                         " FROM trace_events WHERE trace_id = ? ORDER BY seq");
  std::vector<TraceEvent> events;
  if (!stmt.is_valid()) {
    return events;
  }
  stmt.bind_text(1, trace_id);

  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    TraceEvent event;
    event.event_id = stmt.column_text(0);
    event.trace_id = stmt.column_text(1);
    event.event_type = stmt.column_text(2);
    event.payload = stmt.column_text(3);
    event.created_at = stmt.column_text(4);
    const nlohmann::json refs = nlohmann::json::parse(stmt.column_text(5), nullptr, false);
    if (refs.is_array()) {
      for (const auto& ref : refs) {
        if (ref.is_string()) {
          event.refs.push_back(ref.get<std::string>());
        }
      }
    }
    events.push_back(std::move(event));
  }
  return events;
}

std::vector<std::string> SqliteTraceLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM trace_events ORDER BY trace_id");
  std::vector<std::string> ids;
  if (!stmt.is_valid()) {
    return ids;
  }
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

}  // namespace cintel::storage::sqlite
