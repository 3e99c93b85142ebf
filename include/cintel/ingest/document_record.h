#pragma once

#include "cintel/core/ids.h"
#include "cintel/domain/page.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cintel::ingest {

// Size caps on stored text, in bytes.
constexpr std::size_t kMaxPageBytes = 50'000;
constexpr std::size_t kMaxDocumentBytes = 500'000;

// DataTruncationWarning records a cut made to fit the size caps. It is metadata on the
// ingestion result, never a failure.
struct DataTruncationWarning {
  std::string code;             // NOLINT(readability-identifier-naming) "page_truncated" | "document_truncated"
  int page{0};                  // NOLINT(readability-identifier-naming)
  std::size_t original_bytes{0};  // NOLINT(readability-identifier-naming)
  std::size_t kept_bytes{0};    // NOLINT(readability-identifier-naming)
  std::string message;          // NOLINT(readability-identifier-naming)

  bool operator==(const DataTruncationWarning&) const = default;
};

// An ingested document. Immutable once stored; new text means a new document_id.
struct DocumentRecord {
  core::DocumentId document_id;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> filename;         // NOLINT(readability-identifier-naming)
  std::string extraction_method;               // NOLINT(readability-identifier-naming)
  std::string content_hash;                    // NOLINT(readability-identifier-naming)
  std::vector<domain::Page> pages;             // NOLINT(readability-identifier-naming)
  std::vector<DataTruncationWarning> warnings;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> ingested_at;      // NOLINT(readability-identifier-naming)
};

// FNV-1a over page numbers and text. Equal pages, equal hash.
[[nodiscard]] std::string compute_content_hash(const std::vector<domain::Page>& pages);

}  // namespace cintel::ingest
