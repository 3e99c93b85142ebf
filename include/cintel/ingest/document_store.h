#pragma once

#include "cintel/core/ids.h"
#include "cintel/core/result.h"
#include "cintel/domain/page.h"
#include "cintel/ingest/document_record.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cintel::ingest {

// Document-store collaborator. The retrieval core only reads through get_pages;
// ingestion is the sole writer.
class IDocumentStore {
 public:
  virtual ~IDocumentStore() = default;

  // Fails with kConflict when the ID is already stored.
  [[nodiscard]] virtual core::Result<bool, core::StorageError> insert(
      const DocumentRecord& record) = 0;

  // Pages ordered by page_number; kNotFound for unknown IDs.
  [[nodiscard]] virtual core::Result<std::vector<domain::Page>, core::StorageError> get_pages(
      const core::DocumentId& id) const = 0;

  [[nodiscard]] virtual std::optional<DocumentRecord> get(const core::DocumentId& id) const = 0;

  // Sorted by ID.
  [[nodiscard]] virtual std::vector<core::DocumentId> list_ids() const = 0;

 protected:
  IDocumentStore() = default;
  IDocumentStore(const IDocumentStore&) = default;
  IDocumentStore& operator=(const IDocumentStore&) = default;
  IDocumentStore(IDocumentStore&&) = default;
  IDocumentStore& operator=(IDocumentStore&&) = default;
};

class InMemoryDocumentStore final : public IDocumentStore {
 public:
  [[nodiscard]] core::Result<bool, core::StorageError> insert(
      const DocumentRecord& record) override;
  [[nodiscard]] core::Result<std::vector<domain::Page>, core::StorageError> get_pages(
      const core::DocumentId& id) const override;
  [[nodiscard]] std::optional<DocumentRecord> get(const core::DocumentId& id) const override;
  [[nodiscard]] std::vector<core::DocumentId> list_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, DocumentRecord> documents_;
};

}  // namespace cintel::ingest
