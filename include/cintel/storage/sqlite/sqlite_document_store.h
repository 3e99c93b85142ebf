#pragma once

#include "cintel/ingest/document_store.h"
#include "cintel/storage/sqlite/sqlite_db.h"

#include <memory>

namespace cintel::storage::sqlite {

// Documents and their pages in the documents/pages tables. A record and its pages are
// written in one transaction.
class SqliteDocumentStore final : public ingest::IDocumentStore {
 public:
  explicit SqliteDocumentStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, core::StorageError> insert(
      const ingest::DocumentRecord& record) override;
  [[nodiscard]] core::Result<std::vector<domain::Page>, core::StorageError> get_pages(
      const core::DocumentId& id) const override;
  [[nodiscard]] std::optional<ingest::DocumentRecord> get(
      const core::DocumentId& id) const override;
  [[nodiscard]] std::vector<core::DocumentId> list_ids() const override;

 private:
  [[nodiscard]] core::Result<std::vector<domain::Page>, core::StorageError> load_pages(
      const core::DocumentId& id) const;

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace cintel::storage::sqlite
