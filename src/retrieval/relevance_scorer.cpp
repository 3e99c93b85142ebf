#include "cintel/retrieval/relevance_scorer.h"

#include "cintel/core/normalization.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace cintel::retrieval {

namespace {

struct SynonymRow {
  std::string_view term;
  std::array<std::string_view, 4> synonyms;
};

// Sorted by term. Empty slots are unused.
constexpr std::array<SynonymRow, 18> kSynonyms = {{
    {"amount", {"fee", "fees", "price", "payment"}},
    {"cap", {"limit", "limitation", "maximum", "exceed"}},
    {"confidentiality", {"confidential", "nondisclosure", "disclosure", "secret"}},
    {"date", {"dated", "effective", "commence", "commencement"}},
    {"duration", {"term", "period", "months", "years"}},
    {"end", {"terminate", "termination", "expire", "expiration"}},
    {"indemnification", {"indemnify", "indemnity", "hold", "harmless"}},
    {"indemnity", {"indemnify", "indemnification", "harmless", ""}},
    {"jurisdiction", {"governed", "governing", "courts", "venue"}},
    {"law", {"governed", "governing", "jurisdiction", ""}},
    {"liability", {"liable", "damages", "limitation", ""}},
    {"parties", {"party", "between", "", ""}},
    {"pay", {"payment", "invoice", "fees", "due"}},
    {"payment", {"pay", "invoice", "fees", "due"}},
    {"renewal", {"renew", "renews", "automatically", "extend"}},
    {"term", {"duration", "period", "initial", "renewal"}},
    {"terminate", {"termination", "cancel", "end", ""}},
    {"termination", {"terminate", "cancel", "notice", ""}},
}};

double idf(const std::size_t total, const std::size_t df) {
  return 1.0 + std::log((1.0 + static_cast<double>(total)) / (1.0 + static_cast<double>(df)));
}

double tf_weight(const std::size_t tf) {
  return 1.0 + std::log(static_cast<double>(tf));
}

// Largest number of distinct query terms found within any window of `window` tokens.
std::size_t best_window_coverage(const std::vector<std::string>& tokens,
                                 const std::set<std::string>& query, const std::size_t window) {
  std::size_t best = 0;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (query.count(tokens[i]) == 0) {
      continue;
    }
    std::set<std::string_view> seen;
    const std::size_t stop = std::min(tokens.size(), i + window);
    for (std::size_t j = i; j < stop; ++j) {
      if (query.count(tokens[j]) != 0) {
        seen.insert(tokens[j]);
      }
    }
    best = std::max(best, seen.size());
  }
  return best;
}

bool document_order(const domain::Chunk& a, const domain::Chunk& b) {
  return std::tie(a.document_id, a.page, a.start_offset, a.end_offset) <
         std::tie(b.document_id, b.page, b.start_offset, b.end_offset);
}

}  // namespace

RelevanceScorer::RelevanceScorer(ScorerConfig config) : config_(config) {}

std::vector<std::string> RelevanceScorer::expand_terms(const std::vector<std::string>& terms) {
  const std::set<std::string> originals(terms.begin(), terms.end());
  std::set<std::string> expanded;
  for (const auto& term : terms) {
    const auto it = std::lower_bound(
        kSynonyms.begin(), kSynonyms.end(), term,
        [](const SynonymRow& row, const std::string& t) { return row.term < t; });
    if (it == kSynonyms.end() || it->term != term) {
      continue;
    }
    for (const std::string_view synonym : it->synonyms) {
      if (!synonym.empty() && originals.count(std::string(synonym)) == 0) {
        expanded.emplace(synonym);
      }
    }
  }
  return {expanded.begin(), expanded.end()};
}

Ranking RelevanceScorer::score(const std::string_view query,
                               const std::vector<domain::Chunk>& chunks) const {
  Ranking ranking;
  ranking.query_terms = core::content_terms(query);

  if (ranking.query_terms.empty()) {
    ranking.has_relevance_signal = false;
    std::vector<domain::Chunk> ordered = chunks;
    std::sort(ordered.begin(), ordered.end(), document_order);
    for (auto& chunk : ordered) {
      if (ranking.results.size() >= config_.top_k) {
        break;
      }
      ranking.results.push_back(ScoredChunk{.chunk = std::move(chunk), .score = 0.0});
    }
    return ranking;
  }

  ranking.expansion_terms = expand_terms(ranking.query_terms);
  const std::set<std::string> query_set(ranking.query_terms.begin(), ranking.query_terms.end());

  // Term frequencies per chunk for query and expansion terms only.
  std::vector<std::map<std::string, std::size_t>> tfs(chunks.size());
  std::vector<std::vector<std::string>> chunk_tokens(chunks.size());
  std::map<std::string, std::size_t> df;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    chunk_tokens[i] = core::tokenize_ascii(chunks[i].text);
    for (const auto& token : chunk_tokens[i]) {
      if (query_set.count(token) != 0 ||
          std::binary_search(ranking.expansion_terms.begin(), ranking.expansion_terms.end(),
                             token)) {
        ++tfs[i][token];
      }
    }
    for (const auto& [term, count] : tfs[i]) {
      ++df[term];
    }
  }

  std::vector<ScoredChunk> scored;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    double total = 0.0;
    std::vector<std::string> matched;

    for (const auto& term : ranking.query_terms) {
      const auto it = tfs[i].find(term);
      if (it != tfs[i].end()) {
        total += tf_weight(it->second) * idf(chunks.size(), df[term]);
        matched.push_back(term);
      }
    }
    for (const auto& term : ranking.expansion_terms) {
      const auto it = tfs[i].find(term);
      if (it != tfs[i].end()) {
        total += config_.synonym_weight * tf_weight(it->second) * idf(chunks.size(), df[term]);
        matched.push_back(term);
      }
    }

    if (query_set.size() >= 2) {
      const std::size_t coverage =
          best_window_coverage(chunk_tokens[i], query_set, config_.proximity_window);
      if (coverage >= 2) {
        total += config_.proximity_bonus * static_cast<double>(coverage - 1);
      }
    }

    if (total > config_.relevance_floor) {
      std::sort(matched.begin(), matched.end());
      scored.push_back(
          ScoredChunk{.chunk = chunks[i], .score = total, .matched_terms = std::move(matched)});
    }
  }

  std::sort(scored.begin(), scored.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return std::tie(a.chunk.page, a.chunk.start_offset, a.chunk.document_id, a.chunk.end_offset) <
           std::tie(b.chunk.page, b.chunk.start_offset, b.chunk.document_id, b.chunk.end_offset);
  });
  if (scored.size() > config_.top_k) {
    scored.resize(config_.top_k);
  }
  ranking.results = std::move(scored);
  return ranking;
}

}  // namespace cintel::retrieval
