#include "cintel/extraction/field_extractor.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <stdexcept>
#include <string>

using namespace cintel;
using Catch::Matchers::ContainsSubstring;

namespace {

const std::string kPage1 =
    R"(This Services Agreement is made between Acme Corp. and Beta LLC (the "Parties"). )"
    "This agreement is effective as of January 1, 2024. "
    "The initial term of this Agreement is two (2) years.";
const std::string kPage2 =
    "This Agreement shall be governed by the laws of the State of Delaware. "
    "Either party may terminate this Agreement upon thirty (30) days written notice. "
    "Invoices are payable within thirty (30) days of receipt.";
const std::string kPage3 =
    "This Agreement shall renew automatically for successive one-year periods. "
    "Each party shall protect the Confidential Information of the other party. "
    "The Provider's total liability shall not exceed $50,000.00 in the aggregate.";

domain::Chunk whole_page(const int page, const std::string& text) {
  return domain::Chunk{.document_id = core::DocumentId{"doc-1"},
                       .page = page,
                       .start_offset = 0,
                       .end_offset = text.size(),
                       .text = text};
}

domain::ChunkList contract() {
  return {whole_page(1, kPage1), whole_page(2, kPage2), whole_page(3, kPage3)};
}

}  // namespace

TEST_CASE("Default field specs compile", "[extraction][fields]") {
  const extraction::FieldExtractor extractor;
  CHECK(extractor.field_count() == 9);
}

TEST_CASE("FieldExtractor reads the key terms of a contract", "[extraction][fields]") {
  const extraction::FieldExtractor extractor;
  const auto fields = extractor.extract(contract());
  REQUIRE(fields.size() == 9);

  SECTION("dates and amounts are normalized") {
    const auto& effective = fields.at("effective_date");
    CHECK(effective.value == "January 1, 2024");
    CHECK(effective.normalized == std::optional<std::string>{"2024-01-01"});
    CHECK(effective.citation.page() == 1);
    CHECK_THAT(effective.citation.text_snippet(), ContainsSubstring("January 1, 2024"));

    const auto& cap = fields.at("liability_cap");
    CHECK(cap.value == "$50,000.00");
    CHECK(cap.normalized == std::optional<std::string>{"50000.00 USD"});
    CHECK(cap.citation.page() == 3);
  }

  SECTION("day counts are normalized") {
    const auto& notice = fields.at("termination_notice");
    CHECK(notice.value == "thirty (30) days written notice");
    CHECK(notice.normalized == std::optional<std::string>{"30 days"});

    const auto& payment = fields.at("payment_terms");
    CHECK(payment.value == "within thirty (30) days");
    CHECK(payment.normalized == std::optional<std::string>{"30 days"});
  }

  SECTION("plain group values") {
    CHECK(fields.at("governing_law").value == "State of Delaware");
    CHECK_FALSE(fields.at("governing_law").normalized.has_value());
    CHECK(fields.at("term").value == "two (2) years");
    CHECK(fields.at("parties").value == "Acme Corp. and Beta LLC");
  }

  SECTION("sentence fields carry the cited sentence") {
    const auto& renewal = fields.at("auto_renewal");
    CHECK(renewal.value ==
          "This Agreement shall renew automatically for successive one-year periods.");
    CHECK(renewal.value == renewal.citation.text_snippet());
    CHECK(renewal.citation.char_range().first == 0);

    CHECK_THAT(fields.at("confidentiality").value, ContainsSubstring("Confidential Information"));
  }

  SECTION("every citation quotes its page") {
    const std::string pages[] = {kPage1, kPage2, kPage3};
    for (const auto& [name, field] : fields) {
      const auto& page_text = pages[field.citation.page() - 1];
      const auto [begin, end] = field.citation.char_range();
      CHECK(page_text.substr(begin, end - begin) == field.citation.text_snippet());
    }
  }
}

TEST_CASE("FieldExtractor omits fields without a match", "[extraction][fields]") {
  const extraction::FieldExtractor extractor;
  const auto fields = extractor.extract({whole_page(1, "Nothing of note is written here.")});
  CHECK(fields.empty());
  CHECK(extractor.extract({}).empty());
}

TEST_CASE("FieldExtractor takes the first match in document order", "[extraction][fields]") {
  const extraction::FieldExtractor extractor;
  const auto fields =
      extractor.extract({whole_page(1, "This Agreement is governed by the laws of Texas."),
                         whole_page(2, "This Agreement is governed by the laws of Ohio.")});
  REQUIRE(fields.count("governing_law") == 1);
  CHECK(fields.at("governing_law").value == "Texas");
  CHECK(fields.at("governing_law").citation.page() == 1);
}

TEST_CASE("FieldExtractor skips date matches without a valid date", "[extraction][fields]") {
  const extraction::FieldExtractor extractor({extraction::FieldSpec{
      .name = "effective_date",
      .pattern = R"(\beffective\s+(?:as\s+of\s+)?([^;\n]{6,40}))",
      .case_sensitive = false,
      .kind = extraction::ValueKind::kDate}});
  const auto fields = extractor.extract(
      {whole_page(1,
                  "Effective immediately upon signature of this document by both parties. "
                  "Effective as of 2024-05-06 for all.")});
  REQUIRE(fields.count("effective_date") == 1);
  CHECK(fields.at("effective_date").normalized == std::optional<std::string>{"2024-05-06"});
}

TEST_CASE("FieldExtractor rejects an invalid pattern", "[extraction][fields]") {
  CHECK_THROWS_AS(extraction::FieldExtractor({extraction::FieldSpec{
                      .name = "broken", .pattern = "(unclosed", .kind = extraction::ValueKind::kGroup}}),
                  std::runtime_error);
}
