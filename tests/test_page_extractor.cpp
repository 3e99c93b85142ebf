#include "cintel/ingest/page_extractor.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace cintel::ingest;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

TEST_CASE("detect_format_from_path uses the extension", "[ingest][extractor]") {
  CHECK(detect_format_from_path("contract.PDF") == DocumentFormat::kPdf);
  CHECK(detect_format_from_path("/tmp/msa.docx") == DocumentFormat::kDocx);
  CHECK(detect_format_from_path("nda.txt") == DocumentFormat::kText);
  CHECK(detect_format_from_path("notes.md") == DocumentFormat::kText);
  CHECK(detect_format_from_path("archive.bin") == DocumentFormat::kUnknown);
  CHECK(format_name(DocumentFormat::kDocx) == "docx");
}

TEST_CASE("Text without separators is one page", "[ingest][extractor]") {
  TextPageExtractor extractor;
  const auto result = extractor.extract(bytes("Payment is due monthly.\nTerm is one year.\n"));
  REQUIRE(result.has_value());
  REQUIRE(result.value().size() == 1);
  CHECK(result.value()[0] == "Payment is due monthly.\nTerm is one year.\n");
  CHECK(extractor.extraction_method() == "txt-pages-v1");
}

TEST_CASE("Form feeds separate pages", "[ingest][extractor]") {
  TextPageExtractor extractor;
  const auto result = extractor.extract(bytes("Page one text.\fPage two text.\f"));
  REQUIRE(result.has_value());
  CHECK(result.value() == std::vector<std::string>{"Page one text.", "Page two text."});
}

TEST_CASE("Page marker lines separate pages", "[ingest][extractor]") {
  TextPageExtractor extractor;

  SECTION("marker before every page") {
    const auto result = extractor.extract(
        bytes("--- Page 1 ---\nFirst page.\n--- Page 2 ---\nSecond page.\n"));
    REQUIRE(result.has_value());
    CHECK(result.value() == std::vector<std::string>{"First page.", "Second page."});
  }

  SECTION("text before the first marker is its own page") {
    const auto result = extractor.extract(bytes("Cover\n--- Page 1 ---\nBody"));
    REQUIRE(result.has_value());
    CHECK(result.value() == std::vector<std::string>{"Cover", "Body"});
  }

  SECTION("similar lines are not markers") {
    const auto result = extractor.extract(bytes("--- Page one ---\nBody"));
    REQUIRE(result.has_value());
    CHECK(result.value().size() == 1);
  }
}

TEST_CASE("Empty input is rejected", "[ingest][extractor]") {
  CHECK_FALSE(TextPageExtractor().extract({}).has_value());
  CHECK_FALSE(PdfPageExtractor().extract({}).has_value());
  CHECK_FALSE(DocxPageExtractor().extract({}).has_value());
}

TEST_CASE("PDF content streams become pages", "[ingest][extractor]") {
  const std::string pdf =
      "%PDF-1.4\n"
      "1 0 obj\n<< /Length 60 >>\nstream\n"
      "BT /F1 12 Tf (Payment is due) Tj (monthly.) Tj ET\n"
      "endstream\nendobj\n"
      "2 0 obj\n<< /Length 40 >>\nstream\n"
      "BT (Section 4\\(a\\) applies.) Tj ET\n"
      "endstream\nendobj\n%%EOF\n";
  PdfPageExtractor extractor;
  const auto result = extractor.extract(bytes(pdf));
  REQUIRE(result.has_value());
  CHECK(result.value() ==
        std::vector<std::string>{"Payment is due monthly.", "Section 4(a) applies."});
  CHECK(extractor.extraction_method() == "pdf-content-stream-v1");
}

TEST_CASE("PDF without a header or text is rejected", "[ingest][extractor]") {
  PdfPageExtractor extractor;
  const auto invalid = extractor.extract(std::vector<uint8_t>{0x00, 0x01, 0x02, 0x03});
  REQUIRE_FALSE(invalid.has_value());
  CHECK(invalid.error().message.find("Invalid PDF") != std::string::npos);

  const auto empty = extractor.extract(bytes("%PDF-1.4\n1 0 obj\n<< >>\nendobj\n%%EOF\n"));
  REQUIRE_FALSE(empty.has_value());
  CHECK(empty.error().message.find("No text content") != std::string::npos);
}

TEST_CASE("DOCX that is not a ZIP archive is rejected", "[ingest][extractor]") {
  DocxPageExtractor extractor;
  const auto result = extractor.extract(std::vector<uint8_t>{0x00, 0x01, 0x02, 0x03});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().message.find("ZIP") != std::string::npos);
  CHECK(extractor.extraction_method() == "docx-pages-v1");
}
