#include "cintel/audit/risk_auditor.h"
#include "cintel/audit/rule_library.h"
#include "cintel/chunking/chunk_cache.h"
#include "cintel/chunking/chunker.h"
#include "cintel/chunking/redis_chunk_cache.h"
#include "cintel/chunking/redis_config.h"
#include "cintel/core/clock.h"
#include "cintel/core/id_generator.h"
#include "cintel/core/services.h"
#include "cintel/core/version.h"
#include "cintel/extraction/field_extractor.h"
#include "cintel/ingest/document_ingestor.h"
#include "cintel/ingest/document_store.h"
#include "cintel/retrieval/relevance_scorer.h"
#include "cintel/storage/sqlite/sqlite_db.h"
#include "cintel/storage/sqlite/sqlite_document_store.h"
#include "cintel/storage/sqlite/sqlite_trace_log.h"
#include "cintel/storage/trace_log.h"
#include "cintel/streaming/streaming_coordinator.h"
#include "cintel/synthesis/answer_synthesizer.h"
#include "cintel/synthesis/ollama_completion_provider.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace cintel;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto config = server::parse_args(argc, argv);

  if (config.show_help) {
    std::cout << server::usage_text();
    return 0;
  }
  if (config.show_version) {
    std::cout << "cintel_server " << core::kBuildVersion << "\n";
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // The rule library is compiled before anything else is built: a server that cannot audit
  // must not start.
  audit::RiskPolicy policy;
  policy.min_renewal_notice_days = static_cast<int>(config.min_renewal_notice_days);
  policy.max_confidentiality_survival_years = static_cast<int>(config.max_confidentiality_years);
  std::optional<audit::RiskAuditor> auditor;
  try {
    auditor.emplace(audit::make_default_rule_library(policy));
  } catch (const audit::RuleLibraryError& e) {
    std::cerr << "Error: rule library failed to compile: " << e.what() << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "contract-intel server v" << core::kBuildVersion << "\n";
  std::cerr << "Rules:       " << auditor->library().library_id << " v"
            << auditor->library_version() << " (" << auditor->library().rules.size()
            << " rules)\n";

  std::unique_ptr<ingest::IDocumentStore> document_store;
  std::unique_ptr<storage::ITraceLog> trace_log;
  if (config.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(config.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Error: failed to open database: " << db_result.error() << "\n";
      return 1;
    }
    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Error: failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }
    document_store = std::make_unique<storage::sqlite::SqliteDocumentStore>(db);
    trace_log = std::make_unique<storage::sqlite::SqliteTraceLog>(db);
    std::cerr << "Storage:     SQLite -- " << config.db_path.value() << "\n";
  } else {
    document_store = std::make_unique<ingest::InMemoryDocumentStore>();
    trace_log = std::make_unique<storage::InMemoryTraceLog>();
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                 "         Ingested documents and traces will be LOST on process exit.\n"
                 "         Pass --db <path> to enable persistence.\n";
  }

  std::unique_ptr<chunking::IChunkCache> chunk_cache;
  if (config.redis_uri.has_value()) {
    // URI format was validated above.
    const auto redis_cfg = chunking::parse_redis_uri(config.redis_uri.value()).value();
    try {
      chunk_cache = std::make_unique<chunking::RedisChunkCache>(redis_cfg);
      std::cerr << "Chunk cache: Redis -- " << chunking::redis_config_to_log_string(redis_cfg)
                << "\n";
    } catch (const std::exception& e) {
      std::cerr << "WARNING: Redis unreachable (" << e.what() << ").\n"
                << "         Falling back to the in-memory chunk cache.\n";
    }
  }
  if (!chunk_cache) {
    chunk_cache = std::make_unique<chunking::InMemoryChunkCache>();
    if (!config.redis_uri.has_value()) {
      std::cerr << "Chunk cache: in-memory\n";
    }
  }

  std::unique_ptr<synthesis::ICompletionProvider> provider;
  synthesis::SynthesisConfig synthesis_config;
  switch (config.llm) {
    case server::LlmBackend::kOllama: {
      synthesis::OllamaConfig ollama;
      ollama.base_url = config.ollama_url;
      ollama.model = config.ollama_model;
      ollama.timeout_ms = config.llm_timeout_ms;
      provider = std::make_unique<synthesis::OllamaCompletionProvider>(ollama);
      synthesis_config.mode = synthesis::SynthesisMode::kCompletion;
      std::cerr << "Synthesis:   completion -- " << provider->provider_id() << " at "
                << config.ollama_url << " (timeout " << config.llm_timeout_ms << " ms)\n";
      break;
    }
    case server::LlmBackend::kNone:
      std::cerr << "WARNING: No completion provider configured (--llm none).\n"
                   "         Answers are extractive quotes from the top-ranked chunk.\n";
      break;
  }

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  try {
    const chunking::Chunker chunker(chunking::ChunkerConfig{
        .target_size = static_cast<std::size_t>(config.chunk_size),
        .overlap_fraction = config.chunk_overlap,
    });
    retrieval::ScorerConfig scorer_config;
    scorer_config.top_k = static_cast<std::size_t>(config.top_k);
    const retrieval::RelevanceScorer scorer(scorer_config);
    const synthesis::AnswerSynthesizer synthesizer(synthesis_config, provider.get());
    const streaming::StreamingCoordinator coordinator(synthesizer);
    const extraction::FieldExtractor field_extractor;

    core::Services services{*document_store, *chunk_cache, *trace_log, chunker,
                            scorer,          *auditor,     synthesizer, coordinator,
                            field_extractor};

    auto ingestor = ingest::create_document_ingestor();
    core::SystemIdGenerator id_gen;
    core::SystemClock clock;

    server::ServerContext ctx{services, *ingestor, id_gen, clock, config, std::cout};
    server::run_server_loop(std::cin, ctx);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
