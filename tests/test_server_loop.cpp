#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "cintel/audit/rule_library.h"
#include "cintel/core/services.h"

#include "config.h"
#include "mcp_protocol.h"
#include "server_context.h"
#include "server_loop.h"

#include <sstream>
#include <string>
#include <vector>

using namespace cintel;
using json = nlohmann::json;

namespace {

struct ServerHarness {
  ingest::InMemoryDocumentStore documents;
  chunking::InMemoryChunkCache chunk_cache;
  storage::InMemoryTraceLog trace_log;
  chunking::Chunker chunker;
  retrieval::RelevanceScorer scorer;
  audit::RiskAuditor auditor{audit::make_default_rule_library()};
  synthesis::AnswerSynthesizer synthesizer{synthesis::SynthesisConfig{}};
  streaming::StreamingCoordinator coordinator{synthesizer};
  extraction::FieldExtractor field_extractor;
  core::Services services{documents, chunk_cache, trace_log,   chunker,        scorer,
                          auditor,   synthesizer, coordinator, field_extractor};
  std::unique_ptr<ingest::IDocumentIngestor> ingestor = ingest::create_document_ingestor();
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  server::ServerConfig config;

  // Feeds lines to the loop and returns every frame written, parsed.
  std::vector<json> run(const std::vector<json>& requests) {
    std::string input;
    for (const auto& request : requests) {
      input += request.dump() + "\n";
    }
    return run_raw(input);
  }

  std::vector<json> run_raw(const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    server::ServerContext ctx{services, *ingestor, id_gen, clock, config, out};
    server::run_server_loop(in, ctx);

    std::vector<json> frames;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
      frames.push_back(json::parse(line));
    }
    return frames;
  }
};

json tool_call(int id, const std::string& name, const json& arguments) {
  return {{"jsonrpc", "2.0"},
          {"id", id},
          {"method", "tools/call"},
          {"params", {{"name", name}, {"arguments", arguments}}}};
}

}  // namespace

TEST_CASE("parse_request echoes ids of either type", "[server][protocol]") {
  const auto numeric = server::parse_request(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})");
  REQUIRE(numeric.has_value());
  CHECK(numeric->id == std::optional<json>{json(7)});

  const auto text = server::parse_request(R"({"id":"abc","method":"initialize"})");
  REQUIRE(text.has_value());
  CHECK(text->id == std::optional<json>{json("abc")});
  CHECK(text->params.is_object());

  CHECK_FALSE(server::parse_request("[1,2,3]").has_value());
  CHECK_FALSE(server::parse_request("{not json").has_value());

  const auto response = json::parse(server::make_response(json("abc"), {{"ok", true}}));
  CHECK(response["id"] == "abc");
  CHECK(response["result"]["ok"] == true);
}

TEST_CASE("Server loop handles protocol errors", "[server]") {
  ServerHarness harness;
  const auto frames = harness.run_raw(
      "{bad json\n"
      "\n"
      R"({"jsonrpc":"2.0","id":1,"method":"no/such"})" "\n"
      R"({"jsonrpc":"2.0","id":2})" "\n"
      R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n");

  REQUIRE(frames.size() == 3);
  CHECK(frames[0]["error"]["code"] == server::kParseError);
  CHECK(frames[0]["id"].is_null());
  CHECK(frames[1]["error"]["code"] == server::kMethodNotFound);
  CHECK(frames[1]["id"] == 1);
  CHECK(frames[2]["error"]["code"] == server::kInvalidRequest);
}

TEST_CASE("Server loop lists the contract tools", "[server]") {
  ServerHarness harness;
  const auto frames = harness.run({{{"jsonrpc", "2.0"}, {"id", "init"}, {"method", "initialize"}},
                                   {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}}});
  REQUIRE(frames.size() == 2);
  CHECK(frames[0]["id"] == "init");
  CHECK(frames[0]["result"]["serverInfo"]["name"] == "contract-intel");

  std::vector<std::string> names;
  for (const auto& tool : frames[1]["result"]["tools"]) {
    names.push_back(tool["name"].get<std::string>());
  }
  CHECK(names == std::vector<std::string>{"ingest_document", "ask", "ask_stream", "audit",
                                          "extract_fields", "get_chunks", "get_trace"});
}

TEST_CASE("Server loop ingests, answers and audits", "[server]") {
  ServerHarness harness;
  const std::string contract =
      "This agreement is effective as of January 1, 2024. "
      "This agreement shall automatically renew for successive one-year terms unless either "
      "party provides written notice at least 10 days prior to the renewal date.";

  auto frames = harness.run({tool_call(1, "ingest_document", {{"text", contract}})});
  REQUIRE(frames.size() == 1);
  const auto ingested = frames[0]["result"];
  REQUIRE(ingested.contains("document_id"));
  const std::string document_id = ingested["document_id"];
  CHECK(ingested["page_count"] == 1);

  frames = harness.run({
      tool_call(2, "ask", {{"question", "What is the effective date?"}}),
      tool_call(3, "audit", {{"document_id", document_id}}),
      tool_call(4, "get_chunks", {{"document_id", document_id}}),
  });
  REQUIRE(frames.size() == 3);

  const auto answer = frames[0]["result"];
  CHECK(answer["strategy"] == "extractive");
  CHECK(answer["answer"].get<std::string>().find("2024-01-01") != std::string::npos);
  REQUIRE(answer["citations"].size() == 1);
  CHECK(answer["citations"][0]["document_id"] == document_id);

  const auto audit = frames[1]["result"];
  CHECK(audit["rule_library_version"] == "1.0.0");
  REQUIRE(audit["count"].get<std::size_t>() >= 1);
  CHECK(audit["findings"][0]["risk_type"] == "auto_renewal_short_notice");

  CHECK(frames[2]["result"]["count"] == 1);

  frames = harness.run({tool_call(5, "get_trace", {{"trace_id", answer["trace_id"]}})});
  REQUIRE(frames.size() == 1);
  CHECK(frames[0]["result"]["events"].size() == 3);
}

TEST_CASE("Server loop streams answer fragments before the response", "[server][streaming]") {
  ServerHarness harness;
  REQUIRE(harness.run({tool_call(1, "ingest_document",
                                 {{"text", "This agreement is effective as of January 1, 2024."}})})
              .size() == 1);

  const auto frames =
      harness.run({tool_call(2, "ask_stream", {{"question", "What is the effective date?"}})});
  REQUIRE(frames.size() >= 2);

  std::string text;
  for (std::size_t i = 0; i + 1 < frames.size(); ++i) {
    CHECK(frames[i]["method"] == "notifications/answer_fragment");
    CHECK_FALSE(frames[i].contains("id"));
    text += frames[i]["params"]["token"].get<std::string>();
  }
  const auto& final_frame = frames.back();
  CHECK(final_frame["id"] == 2);
  CHECK(final_frame["result"]["done"] == true);
  CHECK(final_frame["result"]["citations"].size() == 1);
  CHECK(text.find("2024-01-01") != std::string::npos);
}

TEST_CASE("Tool failures are reported in the result", "[server]") {
  ServerHarness harness;
  const auto frames = harness.run({
      tool_call(1, "audit", {{"document_id", "doc-404"}}),
      tool_call(2, "ask", json::object()),
      tool_call(3, "no_such_tool", json::object()),
  });
  REQUIRE(frames.size() == 3);
  for (const auto& frame : frames) {
    CHECK(frame["result"].contains("error"));
  }
}
