#include "cintel/storage/sqlite/sqlite_document_store.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <iostream>

namespace cintel::storage::sqlite {

namespace {

using InsertResult = core::Result<bool, core::StorageError>;
using PagesResult = core::Result<std::vector<domain::Page>, core::StorageError>;

nlohmann::json warnings_to_json(const std::vector<ingest::DataTruncationWarning>& warnings) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& w : warnings) {
    out.push_back({{"code", w.code},
                   {"page", w.page},
                   {"original_bytes", w.original_bytes},
                   {"kept_bytes", w.kept_bytes},
                   {"message", w.message}});
  }
  return out;
}

std::vector<ingest::DataTruncationWarning> warnings_from_json(const std::string& text) {
  std::vector<ingest::DataTruncationWarning> warnings;
  const nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
  if (!parsed.is_array()) {
    return warnings;
  }
  for (const auto& item : parsed) {
    warnings.push_back(ingest::DataTruncationWarning{
        .code = item.value("code", ""),
        .page = item.value("page", 0),
        .original_bytes = item.value("original_bytes", std::size_t{0}),
        .kept_bytes = item.value("kept_bytes", std::size_t{0}),
        .message = item.value("message", ""),
    });
  }
  return warnings;
}

// Rolls back unless commit() succeeded.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db) : db_(db) { began_ = db_.exec("BEGIN IMMEDIATE").has_value(); }
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  ~Transaction() {
    if (began_ && !committed_) {
      static_cast<void>(db_.exec("ROLLBACK"));
    }
  }

  [[nodiscard]] bool began() const { return began_; }
  [[nodiscard]] bool commit() {
    committed_ = db_.exec("COMMIT").has_value();
    return committed_;
  }

 private:
  SqliteDb& db_;
  bool began_{false};
  bool committed_{false};
};

}  // namespace

SqliteDocumentStore::SqliteDocumentStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

InsertResult SqliteDocumentStore::insert(const ingest::DocumentRecord& record) {
  std::lock_guard<std::mutex> lock(db_->mutex());

  Transaction tx(*db_);
  if (!tx.began()) {
    return InsertResult::err(core::StorageError::kUnavailable);
  }

  PreparedStatement doc_stmt(db_->connection(),
                             "INSERT INTO documents (document_id, filename, extraction_method,"
                             " content_hash, warnings_json, ingested_at)"
                             " VALUES (?, ?, ?, ?, ?, ?)");
  if (!doc_stmt.is_valid()) {
    std::cerr << "WARNING: document insert not prepared: " << doc_stmt.error() << "\n";
    return InsertResult::err(core::StorageError::kUnavailable);
  }
  doc_stmt.bind_text(1, record.document_id.value);
  if (record.filename.has_value()) {
    doc_stmt.bind_text(2, *record.filename);
  } else {
    doc_stmt.bind_null(2);
  }
  doc_stmt.bind_text(3, record.extraction_method);
  doc_stmt.bind_text(4, record.content_hash);
  doc_stmt.bind_text(5, warnings_to_json(record.warnings).dump());
  if (record.ingested_at.has_value()) {
    doc_stmt.bind_text(6, *record.ingested_at);
  } else {
    doc_stmt.bind_null(6);
  }

  const int rc = sqlite3_step(doc_stmt.get());
  if (rc == SQLITE_CONSTRAINT) {
    return InsertResult::err(core::StorageError::kConflict);
  }
  if (rc != SQLITE_DONE) {
    return InsertResult::err(core::StorageError::kUnavailable);
  }

  PreparedStatement page_stmt(
      db_->connection(), "INSERT INTO pages (document_id, page_number, text) VALUES (?, ?, ?)");
  if (!page_stmt.is_valid()) {
    return InsertResult::err(core::StorageError::kUnavailable);
  }
  for (const auto& page : record.pages) {
    sqlite3_reset(page_stmt.get());
    page_stmt.bind_text(1, record.document_id.value);
    page_stmt.bind_int64(2, page.page_number);
    page_stmt.bind_text(3, page.text);
    if (sqlite3_step(page_stmt.get()) != SQLITE_DONE) {
      return InsertResult::err(core::StorageError::kUnavailable);
    }
  }

  if (!tx.commit()) {
    return InsertResult::err(core::StorageError::kUnavailable);
  }
  return InsertResult::ok(true);
}

PagesResult SqliteDocumentStore::get_pages(const core::DocumentId& id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  return load_pages(id);
}

PagesResult SqliteDocumentStore::load_pages(const core::DocumentId& id) const {
  PreparedStatement exists(db_->connection(), "SELECT 1 FROM documents WHERE document_id = ?");
  if (!exists.is_valid()) {
    return PagesResult::err(core::StorageError::kUnavailable);
  }
  exists.bind_text(1, id.value);
  if (sqlite3_step(exists.get()) != SQLITE_ROW) {
    return PagesResult::err(core::StorageError::kNotFound);
  }

  PreparedStatement stmt(db_->connection(),
                         "SELECT page_number, text FROM pages WHERE document_id = ?"
                         " ORDER BY page_number");
  if (!stmt.is_valid()) {
    return PagesResult::err(core::StorageError::kUnavailable);
  }
  stmt.bind_text(1, id.value);

  std::vector<domain::Page> pages;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    pages.push_back(domain::Page{
        .page_number = sqlite3_column_int(stmt.get(), 0),
        .text = stmt.column_text(1),
    });
  }
  return PagesResult::ok(std::move(pages));
}

std::optional<ingest::DocumentRecord> SqliteDocumentStore::get(const core::DocumentId& id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());

  PreparedStatement stmt(db_->connection(),
                         "SELECT filename, extraction_method, content_hash, warnings_json,"
                         " ingested_at FROM documents WHERE document_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, id.value);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  ingest::DocumentRecord record;
  record.document_id = id;
  if (sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
    record.filename = stmt.column_text(0);
  }
  record.extraction_method = stmt.column_text(1);
  record.content_hash = stmt.column_text(2);
  record.warnings = warnings_from_json(stmt.column_text(3));
  if (sqlite3_column_type(stmt.get(), 4) != SQLITE_NULL) {
    record.ingested_at = stmt.column_text(4);
  }

  auto pages = load_pages(id);
  if (!pages.has_value()) {
    return std::nullopt;
  }
  record.pages = std::move(pages.value());
  return record;
}

std::vector<core::DocumentId> SqliteDocumentStore::list_ids() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "SELECT document_id FROM documents ORDER BY document_id");
  std::vector<core::DocumentId> ids;
  if (!stmt.is_valid()) {
    return ids;
  }
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(core::DocumentId{stmt.column_text(0)});
  }
  return ids;
}

}  // namespace cintel::storage::sqlite
