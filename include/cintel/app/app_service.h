#pragma once

#include "cintel/chunking/chunk_cache.h"
#include "cintel/core/cancellation.h"
#include "cintel/core/clock.h"
#include "cintel/core/id_generator.h"
#include "cintel/core/ids.h"
#include "cintel/core/services.h"
#include "cintel/domain/answer.h"
#include "cintel/domain/extracted_field.h"
#include "cintel/domain/finding.h"
#include "cintel/domain/stream_event.h"
#include "cintel/ingest/document_ingestor.h"
#include "cintel/ingest/document_record.h"
#include "cintel/storage/trace_event.h"
#include "cintel/streaming/streaming_coordinator.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cintel::app {

// Every operation below throws core::InputError for an unknown document_id or an empty
// question, and std::runtime_error when a store fails.

inline constexpr std::string_view kNoDocumentsAvailable =
    "No documents available to answer the question.";

// ────────────────────────────────────────────────────────────────
// Chunks
// ────────────────────────────────────────────────────────────────

// Chunk set of a document, computed once per (document, content hash, chunker configuration)
// and shared through services.chunk_cache.
[[nodiscard]] chunking::SharedChunks get_chunks(const core::DocumentId& document_id,
                                                core::Services& services);

// ────────────────────────────────────────────────────────────────
// Question answering
// ────────────────────────────────────────────────────────────────

struct AnswerRequest {
  std::string question;                                      // NOLINT(readability-identifier-naming)
  // Documents to search; all stored documents when absent or empty.
  std::optional<std::vector<core::DocumentId>> document_ids;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;                       // NOLINT(readability-identifier-naming)
};

struct AnswerResponse {
  std::string trace_id;   // NOLINT(readability-identifier-naming)
  domain::Answer answer;  // NOLINT(readability-identifier-naming)
};

// Emits trace events: AnswerStarted, ChunksRanked, AnswerCompleted
[[nodiscard]] AnswerResponse get_answer(const AnswerRequest& req, core::Services& services,
                                        core::IIdGenerator& id_gen, core::IClock& clock,
                                        const core::CancellationToken& token = {});

struct AnswerStreamResponse {
  std::string trace_id;                          // NOLINT(readability-identifier-naming)
  std::unique_ptr<streaming::AnswerStream> stream;  // NOLINT(readability-identifier-naming)
};

// Validation and ranking happen before this returns; synthesis runs on the stream's producer.
// Emits trace events: AnswerStarted, ChunksRanked
[[nodiscard]] AnswerStreamResponse get_answer_stream(const AnswerRequest& req,
                                                     core::Services& services,
                                                     core::IIdGenerator& id_gen,
                                                     core::IClock& clock);

// Records how a stream ended: AnswerCompleted with the terminal event, or AnswerCancelled when
// there was none.
void record_stream_outcome(const std::string& trace_id,
                           const std::optional<domain::CitationsEvent>& terminal,
                           core::Services& services, core::IIdGenerator& id_gen,
                           core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Risk audit
// ────────────────────────────────────────────────────────────────

struct AuditResponse {
  std::string trace_id;                   // NOLINT(readability-identifier-naming)
  core::DocumentId document_id;           // NOLINT(readability-identifier-naming)
  std::vector<domain::Finding> findings;  // NOLINT(readability-identifier-naming)
  std::string rule_library_version;       // NOLINT(readability-identifier-naming)
};

// Emits trace event: AuditCompleted
[[nodiscard]] AuditResponse get_audit(const core::DocumentId& document_id,
                                      core::Services& services, core::IIdGenerator& id_gen,
                                      core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Ingestion
// ────────────────────────────────────────────────────────────────

// Exactly one of path, text or pages must be set.
struct IngestDocumentRequest {
  std::optional<std::string> path;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> text;                // NOLINT(readability-identifier-naming) plain text
  std::optional<std::vector<std::string>> pages;  // NOLINT(readability-identifier-naming) pre-split
  std::optional<std::string> filename;            // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;            // NOLINT(readability-identifier-naming)
};

struct IngestDocumentResponse {
  std::string trace_id;            // NOLINT(readability-identifier-naming)
  ingest::DocumentRecord record;   // NOLINT(readability-identifier-naming)
};

// Extraction failures are InputErrors. Emits trace event: DocumentIngested
[[nodiscard]] IngestDocumentResponse ingest_document(const IngestDocumentRequest& req,
                                                     ingest::IDocumentIngestor& ingestor,
                                                     core::Services& services,
                                                     core::IIdGenerator& id_gen,
                                                     core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Field extraction
// ────────────────────────────────────────────────────────────────

struct ExtractFieldsResponse {
  std::string trace_id;            // NOLINT(readability-identifier-naming)
  core::DocumentId document_id;    // NOLINT(readability-identifier-naming)
  domain::ExtractedFields fields;  // NOLINT(readability-identifier-naming)
};

// Emits trace event: FieldsExtracted
[[nodiscard]] ExtractFieldsResponse extract_fields(const core::DocumentId& document_id,
                                                   core::Services& services,
                                                   core::IIdGenerator& id_gen,
                                                   core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Traces
// ────────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<storage::TraceEvent> fetch_trace(const std::string& trace_id,
                                                           core::Services& services);

}  // namespace cintel::app
