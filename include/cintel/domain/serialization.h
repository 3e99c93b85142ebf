#pragma once

#include "cintel/domain/answer.h"
#include "cintel/domain/chunk.h"
#include "cintel/domain/extracted_field.h"
#include "cintel/domain/finding.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace cintel::domain {

// Wire shapes. Field names answer, citations, char_range (two-element array),
// document_id, page, text_snippet, risk_type, severity, description and evidence
// are relied on by clients and must not change.

nlohmann::json citation_to_json(const Citation& citation);
nlohmann::json answer_to_json(const Answer& answer);

// Evidence fields are inlined: evidence (snippet text), page, char_range, document_id.
nlohmann::json finding_to_json(const Finding& finding);
nlohmann::json findings_to_json(const std::vector<Finding>& findings);

nlohmann::json extracted_fields_to_json(const ExtractedFields& fields);

nlohmann::json chunk_to_json(const Chunk& chunk);
nlohmann::json chunks_to_json(const ChunkList& chunks);

// Inverse of chunks_to_json; nullopt when the payload does not have the expected shape.
std::optional<ChunkList> chunks_from_json(const std::string& payload);

}  // namespace cintel::domain
