#pragma once

#include "cintel/core/clock.h"
#include "cintel/core/id_generator.h"
#include "cintel/core/result.h"
#include "cintel/domain/page.h"
#include "cintel/ingest/document_record.h"
#include "cintel/ingest/page_extractor.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cintel::ingest {

struct IngestOptions {
  std::optional<std::string> filename;  // NOLINT(readability-identifier-naming)
  bool apply_hygiene{true};             // NOLINT(readability-identifier-naming)
};

using IngestResult = core::Result<DocumentRecord, std::string>;

// Turns raw uploads into capped, page-tagged DocumentRecords. Does not store them.
class IDocumentIngestor {
 public:
  virtual ~IDocumentIngestor() = default;

  [[nodiscard]] virtual IngestResult ingest_file(const std::string& path,
                                                 const IngestOptions& options,
                                                 core::IIdGenerator& id_gen,
                                                 core::IClock& clock) = 0;

  [[nodiscard]] virtual IngestResult ingest_bytes(const std::vector<uint8_t>& data,
                                                  DocumentFormat format,
                                                  const IngestOptions& options,
                                                  core::IIdGenerator& id_gen,
                                                  core::IClock& clock) = 0;

  // Pages already converted to text by an external PDF-to-text service.
  [[nodiscard]] virtual IngestResult ingest_pages(const std::vector<std::string>& page_texts,
                                                  const std::string& extraction_method,
                                                  const IngestOptions& options,
                                                  core::IIdGenerator& id_gen,
                                                  core::IClock& clock) = 0;

 protected:
  IDocumentIngestor() = default;
  IDocumentIngestor(const IDocumentIngestor&) = default;
  IDocumentIngestor& operator=(const IDocumentIngestor&) = default;
  IDocumentIngestor(IDocumentIngestor&&) = default;
  IDocumentIngestor& operator=(IDocumentIngestor&&) = default;
};

[[nodiscard]] std::unique_ptr<IDocumentIngestor> create_document_ingestor();

// Applies kMaxPageBytes and kMaxDocumentBytes at UTF-8 boundaries. Pages past the document
// cap are dropped; page numbers of kept pages are unchanged.
struct CappedPages {
  std::vector<domain::Page> pages;             // NOLINT(readability-identifier-naming)
  std::vector<DataTruncationWarning> warnings;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] CappedPages apply_size_caps(std::vector<domain::Page> pages,
                                          std::size_t max_page_bytes = kMaxPageBytes,
                                          std::size_t max_document_bytes = kMaxDocumentBytes);

}  // namespace cintel::ingest
