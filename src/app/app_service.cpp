#include "cintel/app/app_service.h"

#include "cintel/core/errors.h"
#include "cintel/core/hashing.h"
#include "cintel/core/normalization.h"
#include "cintel/domain/finding.h"
#include "cintel/retrieval/relevance_scorer.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

namespace cintel::app {

namespace {

void append_event(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
                  const std::string& trace_id, const std::string& event_type,
                  const nlohmann::json& payload, std::vector<std::string> refs) {
  services.trace_log.append({id_gen.next("evt"), trace_id, event_type,
                             payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                             clock.now_iso8601(), std::move(refs)});
}

std::vector<std::string> id_strings(const std::vector<core::DocumentId>& ids) {
  std::vector<std::string> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    out.push_back(id.value);
  }
  return out;
}

// Requested documents, deduplicated and sorted, or every stored document. Unknown IDs are
// rejected when their chunks are loaded.
std::vector<core::DocumentId> resolve_candidates(const AnswerRequest& req,
                                                 core::Services& services) {
  if (!req.document_ids.has_value() || req.document_ids->empty()) {
    return services.documents.list_ids();
  }
  std::vector<core::DocumentId> ids = *req.document_ids;
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

struct PreparedQuestion {
  std::string trace_id;
  std::vector<core::DocumentId> candidates;
  retrieval::Ranking ranking;
};

PreparedQuestion prepare_question(const AnswerRequest& req, core::Services& services,
                                  core::IIdGenerator& id_gen, core::IClock& clock,
                                  const std::string& operation) {
  if (core::trim(req.question).empty()) {
    throw core::InputError("question must not be empty");
  }

  PreparedQuestion prepared;
  prepared.trace_id = req.trace_id.value_or(core::TraceId{id_gen.next("trace")}.value);
  prepared.candidates = resolve_candidates(req, services);

  // Unknown documents are rejected here, before the trace records anything.
  domain::ChunkList pool;
  for (const auto& id : prepared.candidates) {
    const auto chunks = get_chunks(id, services);
    pool.insert(pool.end(), chunks->begin(), chunks->end());
  }

  append_event(services, id_gen, clock, prepared.trace_id, "AnswerStarted",
               {{"source", "app_service"},
                {"operation", operation},
                {"question_hash", core::stable_hash64_hex(req.question)},
                {"candidate_count", prepared.candidates.size()}},
               id_strings(prepared.candidates));

  prepared.ranking = services.scorer.score(req.question, pool);

  nlohmann::json ranked = nlohmann::json::array();
  for (const auto& scored : prepared.ranking.results) {
    ranked.push_back({{"document_id", scored.chunk.document_id.value},
                      {"page", scored.chunk.page},
                      {"char_range", {scored.chunk.start_offset, scored.chunk.end_offset}},
                      {"score", scored.score},
                      {"matched_terms", scored.matched_terms}});
  }
  append_event(services, id_gen, clock, prepared.trace_id, "ChunksRanked",
               {{"chunk_pool", pool.size()},
                {"relevance_signal", prepared.ranking.has_relevance_signal},
                {"query_terms", prepared.ranking.query_terms},
                {"expansion_terms", prepared.ranking.expansion_terms},
                {"results", ranked}},
               id_strings(prepared.candidates));
  return prepared;
}

domain::Answer no_documents_answer() {
  return domain::Answer{.text = std::string(kNoDocumentsAvailable),
                        .citations = {},
                        .strategy = domain::AnswerStrategy::kNoRelevantContent,
                        .fallback_reason = std::nullopt};
}

nlohmann::json outcome_payload(const domain::AnswerStrategy strategy,
                               const std::optional<std::string>& fallback_reason,
                               const std::vector<domain::Citation>& citations) {
  nlohmann::json payload{{"strategy", domain::to_string(strategy)},
                         {"citation_count", citations.size()}};
  if (fallback_reason.has_value()) {
    payload["fallback_reason"] = *fallback_reason;
  }
  return payload;
}

}  // namespace

chunking::SharedChunks get_chunks(const core::DocumentId& document_id, core::Services& services) {
  auto pages = services.documents.get_pages(document_id);
  if (!pages.has_value()) {
    if (pages.error() == core::StorageError::kNotFound) {
      throw core::InputError("Document not found: " + document_id.value);
    }
    throw std::runtime_error("Failed to read document " + document_id.value + ": " +
                             core::to_string(pages.error()));
  }

  const chunking::ChunkCacheKey key{.document_id = document_id.value,
                                    .content_hash = ingest::compute_content_hash(pages.value()),
                                    .chunker_signature = services.chunker.signature()};
  if (auto cached = services.chunk_cache.get(key)) {
    return cached;
  }
  auto computed = std::make_shared<const domain::ChunkList>(
      services.chunker.chunk(document_id, pages.value()));
  return services.chunk_cache.put_if_absent(key, std::move(computed));
}

AnswerResponse get_answer(const AnswerRequest& req, core::Services& services,
                          core::IIdGenerator& id_gen, core::IClock& clock,
                          const core::CancellationToken& token) {
  const PreparedQuestion prepared = prepare_question(req, services, id_gen, clock, "get_answer");

  domain::Answer answer = prepared.candidates.empty()
                              ? no_documents_answer()
                              : services.synthesizer.answer(req.question, prepared.ranking, token);

  append_event(services, id_gen, clock, prepared.trace_id, "AnswerCompleted",
               outcome_payload(answer.strategy, answer.fallback_reason, answer.citations),
               id_strings(prepared.candidates));

  return AnswerResponse{.trace_id = prepared.trace_id, .answer = std::move(answer)};
}

AnswerStreamResponse get_answer_stream(const AnswerRequest& req, core::Services& services,
                                       core::IIdGenerator& id_gen, core::IClock& clock) {
  PreparedQuestion prepared =
      prepare_question(req, services, id_gen, clock, "get_answer_stream");
  auto stream = prepared.candidates.empty()
                    ? streaming::StreamingCoordinator::replay(no_documents_answer())
                    : services.answer_streams.stream(req.question, std::move(prepared.ranking));
  return AnswerStreamResponse{.trace_id = prepared.trace_id, .stream = std::move(stream)};
}

void record_stream_outcome(const std::string& trace_id,
                           const std::optional<domain::CitationsEvent>& terminal,
                           core::Services& services, core::IIdGenerator& id_gen,
                           core::IClock& clock) {
  if (!terminal.has_value()) {
    append_event(services, id_gen, clock, trace_id, "AnswerCancelled",
                 {{"source", "app_service"}}, {});
    return;
  }
  append_event(services, id_gen, clock, trace_id, "AnswerCompleted",
               outcome_payload(terminal->strategy, terminal->fallback_reason, terminal->citations),
               {});
}

AuditResponse get_audit(const core::DocumentId& document_id, core::Services& services,
                        core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id = core::TraceId{id_gen.next("trace")}.value;
  const auto chunks = get_chunks(document_id, services);
  auto findings = services.auditor.audit(*chunks);

  nlohmann::json by_severity{{"high", 0}, {"medium", 0}, {"low", 0}};
  for (const auto& finding : findings) {
    const std::string severity = domain::to_string(finding.severity);
    by_severity[severity] = by_severity[severity].get<int>() + 1;
  }
  append_event(services, id_gen, clock, trace_id, "AuditCompleted",
               {{"rule_library_version", services.auditor.library_version()},
                {"chunk_count", chunks->size()},
                {"finding_count", findings.size()},
                {"by_severity", by_severity}},
               {document_id.value});

  return AuditResponse{.trace_id = trace_id,
                       .document_id = document_id,
                       .findings = std::move(findings),
                       .rule_library_version = services.auditor.library_version()};
}

IngestDocumentResponse ingest_document(const IngestDocumentRequest& req,
                                       ingest::IDocumentIngestor& ingestor,
                                       core::Services& services, core::IIdGenerator& id_gen,
                                       core::IClock& clock) {
  const int sources = static_cast<int>(req.path.has_value()) +
                      static_cast<int>(req.text.has_value()) +
                      static_cast<int>(req.pages.has_value());
  if (sources != 1) {
    throw core::InputError("provide exactly one of path, text or pages");
  }
  const std::string trace_id = req.trace_id.value_or(core::TraceId{id_gen.next("trace")}.value);

  ingest::IngestOptions options;
  options.filename = req.filename;

  ingest::IngestResult result = [&]() {
    if (req.path.has_value()) {
      if (!options.filename.has_value()) {
        options.filename = *req.path;
      }
      return ingestor.ingest_file(*req.path, options, id_gen, clock);
    }
    if (req.text.has_value()) {
      const std::vector<uint8_t> bytes(req.text->begin(), req.text->end());
      return ingestor.ingest_bytes(bytes, ingest::DocumentFormat::kText, options, id_gen, clock);
    }
    return ingestor.ingest_pages(*req.pages, "external-pages-v1", options, id_gen, clock);
  }();
  if (!result.has_value()) {
    throw core::InputError("Ingestion failed: " + result.error());
  }

  const ingest::DocumentRecord& record = result.value();
  const auto stored = services.documents.insert(record);
  if (!stored.has_value()) {
    throw std::runtime_error("Failed to store document " + record.document_id.value + ": " +
                             core::to_string(stored.error()));
  }

  nlohmann::json warnings = nlohmann::json::array();
  for (const auto& warning : record.warnings) {
    warnings.push_back(warning.code);
  }
  append_event(services, id_gen, clock, trace_id, "DocumentIngested",
               {{"extraction_method", record.extraction_method},
                {"content_hash", record.content_hash},
                {"page_count", record.pages.size()},
                {"warnings", warnings}},
               {record.document_id.value});

  return IngestDocumentResponse{.trace_id = trace_id, .record = record};
}

ExtractFieldsResponse extract_fields(const core::DocumentId& document_id,
                                     core::Services& services, core::IIdGenerator& id_gen,
                                     core::IClock& clock) {
  const std::string trace_id = core::TraceId{id_gen.next("trace")}.value;
  const auto chunks = get_chunks(document_id, services);
  auto fields = services.field_extractor.extract(*chunks);

  nlohmann::json names = nlohmann::json::array();
  for (const auto& [name, field] : fields) {
    names.push_back(name);
  }
  append_event(services, id_gen, clock, trace_id, "FieldsExtracted",
               {{"field_count", fields.size()}, {"fields", names}}, {document_id.value});

  return ExtractFieldsResponse{
      .trace_id = trace_id, .document_id = document_id, .fields = std::move(fields)};
}

std::vector<storage::TraceEvent> fetch_trace(const std::string& trace_id,
                                             core::Services& services) {
  return services.trace_log.query(trace_id);
}

}  // namespace cintel::app
