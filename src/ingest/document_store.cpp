#include "cintel/ingest/document_store.h"

#include "cintel/core/hashing.h"

#include <algorithm>

namespace cintel::ingest {

std::string compute_content_hash(const std::vector<domain::Page>& pages) {
  std::string canonical;
  for (const auto& page : pages) {
    canonical += std::to_string(page.page_number);
    canonical += '\x1f';
    canonical += page.text;
    canonical += '\x1e';
  }
  return "fnv1a:" + core::stable_hash64_hex(canonical);
}

core::Result<bool, core::StorageError> InMemoryDocumentStore::insert(
    const DocumentRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto [it, inserted] = documents_.try_emplace(record.document_id.value, record);
  if (!inserted) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kConflict);
  }
  return core::Result<bool, core::StorageError>::ok(true);
}

core::Result<std::vector<domain::Page>, core::StorageError> InMemoryDocumentStore::get_pages(
    const core::DocumentId& id) const {
  using PagesResult = core::Result<std::vector<domain::Page>, core::StorageError>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = documents_.find(id.value);
  if (it == documents_.end()) {
    return PagesResult::err(core::StorageError::kNotFound);
  }
  std::vector<domain::Page> pages = it->second.pages;
  std::stable_sort(pages.begin(), pages.end(), [](const domain::Page& a, const domain::Page& b) {
    return a.page_number < b.page_number;
  });
  return PagesResult::ok(std::move(pages));
}

std::optional<DocumentRecord> InMemoryDocumentStore::get(const core::DocumentId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = documents_.find(id.value);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<core::DocumentId> InMemoryDocumentStore::list_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<core::DocumentId> ids;
  ids.reserve(documents_.size());
  for (const auto& [key, record] : documents_) {
    ids.push_back(record.document_id);
  }
  return ids;
}

}  // namespace cintel::ingest
