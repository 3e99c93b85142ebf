#pragma once

#include "cintel/audit/risk_auditor.h"
#include "cintel/chunking/chunk_cache.h"
#include "cintel/chunking/chunker.h"
#include "cintel/extraction/field_extractor.h"
#include "cintel/ingest/document_store.h"
#include "cintel/retrieval/relevance_scorer.h"
#include "cintel/storage/trace_log.h"
#include "cintel/streaming/streaming_coordinator.h"
#include "cintel/synthesis/answer_synthesizer.h"

namespace cintel::core {

// Services is the composition root bundling every engine dependency.
// It holds references, not ownership; the server or a test creates the concrete instances and
// keeps them alive for as long as the Services value is used.
struct Services {
  ingest::IDocumentStore& documents;                    // NOLINT(readability-identifier-naming)
  chunking::IChunkCache& chunk_cache;                   // NOLINT(readability-identifier-naming)
  storage::ITraceLog& trace_log;                        // NOLINT(readability-identifier-naming)
  const chunking::Chunker& chunker;                     // NOLINT(readability-identifier-naming)
  const retrieval::RelevanceScorer& scorer;             // NOLINT(readability-identifier-naming)
  const audit::RiskAuditor& auditor;                    // NOLINT(readability-identifier-naming)
  const synthesis::AnswerSynthesizer& synthesizer;      // NOLINT(readability-identifier-naming)
  const streaming::StreamingCoordinator& answer_streams;  // NOLINT(readability-identifier-naming)
  const extraction::FieldExtractor& field_extractor;    // NOLINT(readability-identifier-naming)

  Services(ingest::IDocumentStore& documents, chunking::IChunkCache& chunk_cache,
           storage::ITraceLog& trace_log, const chunking::Chunker& chunker,
           const retrieval::RelevanceScorer& scorer, const audit::RiskAuditor& auditor,
           const synthesis::AnswerSynthesizer& synthesizer,
           const streaming::StreamingCoordinator& answer_streams,
           const extraction::FieldExtractor& field_extractor)
      : documents(documents),
        chunk_cache(chunk_cache),
        trace_log(trace_log),
        chunker(chunker),
        scorer(scorer),
        auditor(auditor),
        synthesizer(synthesizer),
        answer_streams(answer_streams),
        field_extractor(field_extractor) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace cintel::core
