#include "cintel/domain/serialization.h"

namespace cintel::domain {

nlohmann::json citation_to_json(const Citation& citation) {
  const auto [start, end] = citation.char_range();
  return nlohmann::json{
      {"document_id", citation.document_id().value},
      {"page", citation.page()},
      {"char_range", nlohmann::json::array({start, end})},
      {"text_snippet", citation.text_snippet()},
  };
}

nlohmann::json answer_to_json(const Answer& answer) {
  nlohmann::json citations = nlohmann::json::array();
  for (const auto& citation : answer.citations) {
    citations.push_back(citation_to_json(citation));
  }

  nlohmann::json j;
  j["answer"] = answer.text;
  j["citations"] = std::move(citations);
  j["strategy"] = to_string(answer.strategy);
  if (answer.fallback_reason.has_value()) {
    j["fallback_reason"] = *answer.fallback_reason;
  }
  return j;
}

nlohmann::json finding_to_json(const Finding& finding) {
  const auto [start, end] = finding.evidence.char_range();
  return nlohmann::json{
      {"risk_type", finding.risk_type},
      {"severity", to_string(finding.severity)},
      {"description", finding.description},
      {"evidence", finding.evidence.text_snippet()},
      {"page", finding.evidence.page()},
      {"char_range", nlohmann::json::array({start, end})},
      {"document_id", finding.evidence.document_id().value},
      {"rule_version", finding.rule_version},
  };
}

nlohmann::json findings_to_json(const std::vector<Finding>& findings) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& finding : findings) {
    out.push_back(finding_to_json(finding));
  }
  return out;
}

nlohmann::json extracted_fields_to_json(const ExtractedFields& fields) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [name, field] : fields) {
    nlohmann::json entry;
    entry["value"] = field.value;
    if (field.normalized.has_value()) {
      entry["normalized"] = *field.normalized;
    }
    entry["citation"] = citation_to_json(field.citation);
    out[name] = std::move(entry);
  }
  return out;
}

nlohmann::json chunk_to_json(const Chunk& chunk) {
  return nlohmann::json{
      {"document_id", chunk.document_id.value},
      {"page", chunk.page},
      {"start_offset", chunk.start_offset},
      {"end_offset", chunk.end_offset},
      {"text", chunk.text},
  };
}

nlohmann::json chunks_to_json(const ChunkList& chunks) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& chunk : chunks) {
    out.push_back(chunk_to_json(chunk));
  }
  return out;
}

std::optional<ChunkList> chunks_from_json(const std::string& payload) {
  const nlohmann::json parsed = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
  if (!parsed.is_array()) {
    return std::nullopt;
  }

  ChunkList chunks;
  chunks.reserve(parsed.size());
  for (const auto& item : parsed) {
    if (!item.is_object() || !item.value("document_id", nlohmann::json()).is_string() ||
        !item.value("page", nlohmann::json()).is_number_integer() ||
        !item.value("start_offset", nlohmann::json()).is_number_unsigned() ||
        !item.value("end_offset", nlohmann::json()).is_number_unsigned() ||
        !item.value("text", nlohmann::json()).is_string()) {
      return std::nullopt;
    }
    Chunk chunk;
    chunk.document_id = core::DocumentId{item["document_id"].get<std::string>()};
    chunk.page = item["page"].get<int>();
    chunk.start_offset = item["start_offset"].get<std::size_t>();
    chunk.end_offset = item["end_offset"].get<std::size_t>();
    chunk.text = item["text"].get<std::string>();
    if (chunk.start_offset >= chunk.end_offset ||
        chunk.end_offset - chunk.start_offset != chunk.text.size()) {
      return std::nullopt;
    }
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

}  // namespace cintel::domain
