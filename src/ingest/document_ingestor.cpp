#include "cintel/ingest/document_ingestor.h"

#include "cintel/core/utf8.h"
#include "cintel/ingest/hygiene.h"

#include <filesystem>
#include <fstream>

namespace cintel::ingest {

namespace {

core::Result<std::vector<uint8_t>, std::string> read_file_bytes(const std::string& path) {
  using BytesResult = core::Result<std::vector<uint8_t>, std::string>;
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return BytesResult::err("Failed to open file: " + path);
  }
  const std::streamsize size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<std::size_t>(size));
  if (!file.read(reinterpret_cast<char*>(data.data()), size)) {  // NOLINT
    return BytesResult::err("Failed to read file: " + path);
  }
  return BytesResult::ok(std::move(data));
}

class DocumentIngestor final : public IDocumentIngestor {
 public:
  IngestResult ingest_file(const std::string& path, const IngestOptions& options,
                           core::IIdGenerator& id_gen, core::IClock& clock) override {
    auto bytes = read_file_bytes(path);
    if (!bytes.has_value()) {
      return IngestResult::err(bytes.error());
    }
    IngestOptions opts = options;
    if (!opts.filename.has_value()) {
      opts.filename = std::filesystem::path(path).filename().string();
    }
    return ingest_bytes(bytes.value(), detect_format_from_path(path), opts, id_gen, clock);
  }

  IngestResult ingest_bytes(const std::vector<uint8_t>& data, const DocumentFormat format,
                            const IngestOptions& options, core::IIdGenerator& id_gen,
                            core::IClock& clock) override {
    if (data.empty()) {
      return IngestResult::err("Empty input data");
    }
    const auto extractor = create_page_extractor(format);
    auto pages = extractor->extract(data);
    if (!pages.has_value()) {
      return IngestResult::err("Extraction failed: " + pages.error().message);
    }
    return ingest_pages(pages.value(), extractor->extraction_method(), options, id_gen, clock);
  }

  IngestResult ingest_pages(const std::vector<std::string>& page_texts,
                            const std::string& extraction_method, const IngestOptions& options,
                            core::IIdGenerator& id_gen, core::IClock& clock) override {
    if (page_texts.empty()) {
      return IngestResult::err("Document has no pages");
    }

    std::vector<domain::Page> pages;
    pages.reserve(page_texts.size());
    int page_number = 1;
    for (const auto& raw : page_texts) {
      std::string text = hygiene::repair_utf8(raw);
      pages.push_back(domain::Page{
          .page_number = page_number++,
          .text = options.apply_hygiene ? hygiene::apply_hygiene(text) : std::move(text),
      });
    }

    CappedPages capped = apply_size_caps(std::move(pages));

    DocumentRecord record;
    record.document_id = core::DocumentId{id_gen.next("doc")};
    record.filename = options.filename;
    record.extraction_method = extraction_method;
    record.content_hash = compute_content_hash(capped.pages);
    record.pages = std::move(capped.pages);
    record.warnings = std::move(capped.warnings);
    record.ingested_at = clock.now_iso8601();
    return IngestResult::ok(std::move(record));
  }
};

}  // namespace

CappedPages apply_size_caps(std::vector<domain::Page> pages, const std::size_t max_page_bytes,
                            const std::size_t max_document_bytes) {
  CappedPages out;
  std::size_t total = 0;

  for (auto& page : pages) {
    const std::size_t original = page.text.size();

    if (page.text.size() > max_page_bytes) {
      page.text.resize(core::utf8_floor(page.text, max_page_bytes));
      out.warnings.push_back(DataTruncationWarning{
          .code = "page_truncated",
          .page = page.page_number,
          .original_bytes = original,
          .kept_bytes = page.text.size(),
          .message = "Page " + std::to_string(page.page_number) + " truncated from " +
                     std::to_string(original) + " to " + std::to_string(page.text.size()) +
                     " bytes",
      });
    }

    const std::size_t remaining = max_document_bytes - total;
    if (page.text.size() > remaining) {
      const std::size_t before = page.text.size();
      page.text.resize(core::utf8_floor(page.text, remaining));
      out.warnings.push_back(DataTruncationWarning{
          .code = "document_truncated",
          .page = page.page_number,
          .original_bytes = before,
          .kept_bytes = page.text.size(),
          .message = "Document size cap of " + std::to_string(max_document_bytes) +
                     " bytes reached at page " + std::to_string(page.page_number) +
                     "; remaining text dropped",
      });
      if (!page.text.empty()) {
        total += page.text.size();
        out.pages.push_back(std::move(page));
      }
      break;
    }

    total += page.text.size();
    out.pages.push_back(std::move(page));
  }
  return out;
}

std::unique_ptr<IDocumentIngestor> create_document_ingestor() {
  return std::make_unique<DocumentIngestor>();
}

}  // namespace cintel::ingest
