#include "cintel/core/clock.h"
#include "cintel/core/id_generator.h"
#include "cintel/ingest/document_ingestor.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace cintel;
using namespace cintel::ingest;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

TEST_CASE("Document ingestor reads a text file into pages", "[ingest][ingestor]") {
  const std::string test_file = "test_ingest_contract.txt";
  {
    std::ofstream ofs(test_file);
    ofs << "MASTER SERVICES AGREEMENT\r\n\fTerm: one year.   \n";
  }

  auto ingestor = create_document_ingestor();
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");

  auto result = ingestor->ingest_file(test_file, IngestOptions{}, id_gen, clock);
  std::remove(test_file.c_str());

  REQUIRE(result.has_value());
  const DocumentRecord& record = result.value();
  CHECK(record.document_id.value == "doc-0");
  CHECK(record.filename == std::optional<std::string>(test_file));
  CHECK(record.extraction_method == "txt-pages-v1");
  CHECK(record.ingested_at == std::optional<std::string>("2026-01-01T00:00:00Z"));
  REQUIRE(record.pages.size() == 2);
  CHECK(record.pages[0] == domain::Page{1, "MASTER SERVICES AGREEMENT\n"});
  CHECK(record.pages[1] == domain::Page{2, "Term: one year.\n"});
  CHECK(record.warnings.empty());
  CHECK(record.content_hash.starts_with("fnv1a:"));
}

TEST_CASE("Document ingestor reports a missing file", "[ingest][ingestor]") {
  auto ingestor = create_document_ingestor();
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  const auto result =
      ingestor->ingest_file("does_not_exist_contract.txt", IngestOptions{}, id_gen, clock);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("Failed to open file") != std::string::npos);
}

TEST_CASE("Document ingestor rejects empty data", "[ingest][ingestor]") {
  auto ingestor = create_document_ingestor();
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  CHECK_FALSE(
      ingestor->ingest_bytes({}, DocumentFormat::kText, IngestOptions{}, id_gen, clock).has_value());
  CHECK_FALSE(ingestor->ingest_pages({}, "external-pages-v1", IngestOptions{}, id_gen, clock)
                  .has_value());
}

TEST_CASE("Document ingestor can disable hygiene", "[ingest][ingestor]") {
  auto ingestor = create_document_ingestor();
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");

  IngestOptions options;
  options.apply_hygiene = false;
  const auto result =
      ingestor->ingest_bytes(bytes("Term   \r\n"), DocumentFormat::kText, options, id_gen, clock);
  REQUIRE(result.has_value());
  CHECK(result.value().pages[0].text == "Term   \r\n");
}

TEST_CASE("Document ingestor stores valid UTF-8 for cp1252 input", "[ingest][ingestor]") {
  auto ingestor = create_document_ingestor();
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");

  for (const bool hygiene : {true, false}) {
    IngestOptions options;
    options.apply_hygiene = hygiene;
    const auto result = ingestor->ingest_bytes(bytes("Due under \xA7 4."), DocumentFormat::kText,
                                               options, id_gen, clock);
    REQUIRE(result.has_value());
    CHECK(result.value().pages[0].text == "Due under \xEF\xBF\xBD 4.");
  }
}

TEST_CASE("Content hash depends only on page text", "[ingest][ingestor]") {
  auto ingestor = create_document_ingestor();
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");

  const auto a = ingestor->ingest_pages({"Page one.", "Page two."}, "external-pages-v1",
                                        IngestOptions{}, id_gen, clock);
  const auto b = ingestor->ingest_pages({"Page one.", "Page two."}, "external-pages-v1",
                                        IngestOptions{}, id_gen, clock);
  const auto c = ingestor->ingest_pages({"Page one.", "Page 2."}, "external-pages-v1",
                                        IngestOptions{}, id_gen, clock);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(c.has_value());
  CHECK(a.value().document_id != b.value().document_id);
  CHECK(a.value().content_hash == b.value().content_hash);
  CHECK(a.value().content_hash != c.value().content_hash);
}

TEST_CASE("Oversized pages are truncated with a warning", "[ingest][caps]") {
  std::vector<domain::Page> pages{{1, std::string(30, 'a')}, {2, "short"}};
  const auto capped = apply_size_caps(std::move(pages), 20, 1000);

  REQUIRE(capped.pages.size() == 2);
  CHECK(capped.pages[0].text == std::string(20, 'a'));
  CHECK(capped.pages[1].text == "short");
  REQUIRE(capped.warnings.size() == 1);
  CHECK(capped.warnings[0].code == "page_truncated");
  CHECK(capped.warnings[0].page == 1);
  CHECK(capped.warnings[0].original_bytes == 30);
  CHECK(capped.warnings[0].kept_bytes == 20);
}

TEST_CASE("Document cap drops the remaining pages", "[ingest][caps]") {
  std::vector<domain::Page> pages{
      {1, std::string(10, 'a')}, {2, std::string(10, 'b')}, {3, std::string(10, 'c')}};
  const auto capped = apply_size_caps(std::move(pages), 100, 15);

  REQUIRE(capped.pages.size() == 2);
  CHECK(capped.pages[1].page_number == 2);
  CHECK(capped.pages[1].text == std::string(5, 'b'));
  REQUIRE(capped.warnings.size() == 1);
  CHECK(capped.warnings[0].code == "document_truncated");
  CHECK(capped.warnings[0].page == 2);
}

TEST_CASE("Size caps never split a UTF-8 sequence", "[ingest][caps]") {
  std::string text;
  for (int i = 0; i < 10; ++i) {
    text += "\xE2\x82\xAC";  // euro sign, 3 bytes
  }
  std::vector<domain::Page> pages{{1, text}};
  const auto capped = apply_size_caps(std::move(pages), 10, 1000);
  REQUIRE(capped.pages.size() == 1);
  CHECK(capped.pages[0].text.size() == 9);
  CHECK(capped.warnings[0].kept_bytes == 9);
}

TEST_CASE("Documents within the caps are untouched", "[ingest][caps]") {
  std::vector<domain::Page> pages{{1, "Term."}, {2, "Payment."}};
  const auto capped = apply_size_caps(pages);
  CHECK(capped.pages == pages);
  CHECK(capped.warnings.empty());
}
