#include "cintel/audit/rule_library.h"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>
#include <vector>

using namespace cintel::audit;

namespace {

RuleSpec pattern_row(const std::string& risk_type, const std::string& pattern) {
  return RuleSpec{.risk_type = risk_type,
                  .version = "1.0",
                  .kind = RuleKind::kPattern,
                  .description = "test rule",
                  .pattern = pattern};
}

}  // namespace

TEST_CASE("Default rule library compiles with unique risk types", "[audit][rules]") {
  const auto library = make_default_rule_library();
  CHECK(library.library_id == "contract-risk");
  CHECK(library.version == "1.0.0");
  REQUIRE(library.rules.size() == 8);

  std::set<std::string> types;
  for (const auto& rule : library.rules) {
    types.emplace(rule->risk_type());
  }
  CHECK(types.size() == library.rules.size());
  CHECK(types.count("auto_renewal_short_notice") == 1);
  CHECK(types.count("governing_law_absent") == 1);
}

TEST_CASE("Policy thresholds flow into the rule table", "[audit][rules]") {
  RiskPolicy policy;
  policy.min_renewal_notice_days = 45;
  policy.max_confidentiality_survival_years = 3;
  const auto table = default_rule_table(policy);
  for (const auto& row : table) {
    if (row.risk_type == "auto_renewal_short_notice") {
      CHECK(row.threshold == 45);
      CHECK(row.check == NumericCheck::kLessThan);
    }
    if (row.risk_type == "confidentiality_survival_excessive") {
      CHECK(row.threshold == 3);
    }
    if (row.kind == RuleKind::kAbsence) {
      CHECK(row.min_document_bytes == 1000);
    }
  }
}

TEST_CASE("Invalid rule tables are rejected", "[audit][rules]") {
  SECTION("malformed pattern") {
    CHECK_THROWS_AS(compile_rule_library("t", "1", {pattern_row("broken", "(unclosed")}),
                    RuleLibraryError);
  }
  SECTION("duplicate risk type") {
    CHECK_THROWS_AS(
        compile_rule_library("t", "1", {pattern_row("dup", "a"), pattern_row("dup", "b")}),
        RuleLibraryError);
  }
  SECTION("missing risk type") {
    CHECK_THROWS_AS(compile_rule_library("t", "1", {pattern_row("", "a")}), RuleLibraryError);
  }
  SECTION("pattern rule without a pattern") {
    CHECK_THROWS_AS(compile_rule_library("t", "1", {pattern_row("empty", "")}),
                    RuleLibraryError);
  }
  SECTION("numeric check without a capture group") {
    auto row = pattern_row("numeric", "days");
    row.check = NumericCheck::kLessThan;
    CHECK_THROWS_AS(compile_rule_library("t", "1", {row}), RuleLibraryError);
  }
  SECTION("absence rule without a required pattern") {
    auto row = pattern_row("absent", "anchor");
    row.kind = RuleKind::kAbsence;
    CHECK_THROWS_AS(compile_rule_library("t", "1", {row}), RuleLibraryError);
  }
}

TEST_CASE("Custom rule tables evaluate in the given order", "[audit][rules]") {
  const auto library = compile_rule_library(
      "custom", "2.0", {pattern_row("first", "alpha"), pattern_row("second", "beta")});
  REQUIRE(library.rules.size() == 2);
  CHECK(library.rules[0]->risk_type() == "first");
  CHECK(library.rules[1]->risk_type() == "second");

  const std::vector<cintel::domain::Chunk> chunks{cintel::domain::Chunk{
      .document_id = cintel::core::DocumentId{"d"},
      .page = 1,
      .start_offset = 0,
      .end_offset = 17,
      .text = "Alpha then alpha."}};
  const auto hits = library.rules[0]->evaluate(chunks);
  REQUIRE(hits.size() == 2);
  CHECK(hits[0].span == cintel::citation::Span{0, 5});
  CHECK(hits[1].span == cintel::citation::Span{11, 16});
}
