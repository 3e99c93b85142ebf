#pragma once

#include "cintel/core/result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cintel::ingest {

struct ExtractionError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

// Page texts in document order; element i is page i + 1.
using PageExtractionResult = core::Result<std::vector<std::string>, ExtractionError>;

enum class DocumentFormat {
  kText,
  kPdf,
  kDocx,
  kUnknown,
};

[[nodiscard]] DocumentFormat detect_format_from_path(std::string_view path);
[[nodiscard]] std::string_view format_name(DocumentFormat format);

// Converts an uploaded file into per-page plain text.
class IPageExtractor {
 public:
  virtual ~IPageExtractor() = default;

  [[nodiscard]] virtual PageExtractionResult extract(const std::vector<uint8_t>& data) const = 0;

  // Identifier persisted with the document, e.g. "txt-pages-v1".
  [[nodiscard]] virtual std::string extraction_method() const = 0;

 protected:
  IPageExtractor() = default;
  IPageExtractor(const IPageExtractor&) = default;
  IPageExtractor& operator=(const IPageExtractor&) = default;
  IPageExtractor(IPageExtractor&&) = default;
  IPageExtractor& operator=(IPageExtractor&&) = default;
};

// Plain text. Pages are separated by form feeds, or by "--- Page N ---" marker lines as
// written by common PDF-to-text converters. Text with neither is a single page.
class TextPageExtractor final : public IPageExtractor {
 public:
  [[nodiscard]] PageExtractionResult extract(const std::vector<uint8_t>& data) const override;
  [[nodiscard]] std::string extraction_method() const override { return "txt-pages-v1"; }
};

// Best-effort PDF text: string literals shown in uncompressed content streams, one page per
// stream that carries text. Compressed or scanned PDFs yield an ExtractionError; a real
// PDF-to-text converter should feed TextPageExtractor instead.
class PdfPageExtractor final : public IPageExtractor {
 public:
  [[nodiscard]] PageExtractionResult extract(const std::vector<uint8_t>& data) const override;
  [[nodiscard]] std::string extraction_method() const override { return "pdf-content-stream-v1"; }
};

// DOCX via libzip and pugixml. Paragraphs become lines; explicit page breaks
// (<w:br w:type="page"/>, <w:pageBreakBefore/>) start a new page.
class DocxPageExtractor final : public IPageExtractor {
 public:
  [[nodiscard]] PageExtractionResult extract(const std::vector<uint8_t>& data) const override;
  [[nodiscard]] std::string extraction_method() const override { return "docx-pages-v1"; }
};

[[nodiscard]] std::unique_ptr<IPageExtractor> create_page_extractor(DocumentFormat format);

}  // namespace cintel::ingest
