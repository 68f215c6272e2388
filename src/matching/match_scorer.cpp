#include "catmatch/matching/match_scorer.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <stdexcept>

namespace catmatch::matching {

double AttributeAgreement::score() const {
  if (comparable_count == 0) {
    return 0.0;
  }
  return static_cast<double>(match_count) / static_cast<double>(comparable_count);
}

AttributeAgreement compare_attributes(const domain::AttributeSet& unstructured,
                                      const domain::AttributeSet& catalog) {
  AttributeAgreement agreement;

  for (const auto kind : domain::kAllAttributeKinds) {
    const auto& lhs = unstructured.get(kind);
    const auto& rhs = catalog.get(kind);
    if (!lhs.has_value() || !rhs.has_value()) {
      continue;
    }

    ++agreement.comparable_count;
    if (*lhs == *rhs) {
      ++agreement.match_count;
      agreement.reason_fragments.push_back(std::string(domain::attribute_label(kind)) + ": " +
                                           *lhs);
    }
  }

  return agreement;
}

std::vector<std::size_t> select_candidates(const std::span<const double> similarity_row,
                                           const std::size_t top_k) {
  std::vector<std::size_t> indices(similarity_row.size());
  std::iota(indices.begin(), indices.end(), std::size_t{0});

  const std::size_t k = std::min(top_k, indices.size());

  // Sort by similarity descending, then catalog index ascending (deterministic tie-break)
  std::partial_sort(indices.begin(), indices.begin() + static_cast<std::ptrdiff_t>(k),
                    indices.end(), [&similarity_row](std::size_t a, std::size_t b) {
                      if (similarity_row[a] != similarity_row[b]) {
                        return similarity_row[a] > similarity_row[b];
                      }
                      return a < b;
                    });

  indices.resize(k);
  return indices;
}

double to_confidence(const double fused_score) {
  const double confidence = std::round(fused_score * 100.0 * 100.0) / 100.0;
  return std::clamp(confidence, 0.0, 100.0);
}

MatchScorer::MatchScorer(MatcherConfig config) : config_(config) {
  auto validation = config_.validate();
  if (!validation.has_value()) {
    throw std::invalid_argument("invalid matcher config: " + validation.error());
  }
}

CandidateScore MatchScorer::score_candidate(const domain::UnstructuredItem& item,
                                            const domain::CatalogItem& candidate,
                                            const std::size_t catalog_index,
                                            const double text_score) const {
  auto agreement = compare_attributes(item.attributes, candidate.attributes);

  CandidateScore scored;
  scored.catalog_index = catalog_index;
  scored.text_score = std::clamp(text_score, 0.0, 1.0);
  scored.attribute_score = agreement.score();
  scored.fused_score = config_.weights.text * scored.text_score +
                       config_.weights.attribute * scored.attribute_score;
  scored.reason_fragments = std::move(agreement.reason_fragments);
  return scored;
}

std::string MatchScorer::explain(const CandidateScore& winner) const {
  if (!winner.reason_fragments.empty()) {
    std::string reason;
    for (const auto& fragment : winner.reason_fragments) {
      if (!reason.empty()) {
        reason += " | ";
      }
      reason += fragment;
    }
    return reason;
  }

  if (winner.text_score > config_.high_text_similarity) {
    return domain::kHighTextSimilarityReason;
  }

  return domain::kLowConfidenceReason;
}

domain::MatchResult MatchScorer::score(const domain::UnstructuredItem& item,
                                       const std::vector<domain::CatalogItem>& catalog,
                                       const std::span<const double> similarity_row) const {
  if (similarity_row.size() != catalog.size()) {
    throw std::invalid_argument("similarity row has " + std::to_string(similarity_row.size()) +
                                " columns but the catalog has " + std::to_string(catalog.size()) +
                                " items");
  }

  domain::MatchResult result;
  result.unstructured_id = item.id;
  result.original_description = item.description;

  const auto candidates = select_candidates(similarity_row, config_.top_k);
  result.candidates_considered = candidates.size();

  // Empty pool: null match, zero confidence, default low-confidence reason
  if (candidates.empty()) {
    return result;
  }

  std::optional<CandidateScore> best;
  for (const std::size_t index : candidates) {
    auto scored = score_candidate(item, catalog[index], index, similarity_row[index]);

    // Strict > keeps the earlier (more similar) candidate on equal scores
    if (!best.has_value() || scored.fused_score > best->fused_score) {
      best = std::move(scored);
    }
  }

  const auto& winner = catalog[best->catalog_index];
  result.matched_catalog_id = winner.id;
  result.matched_description = winner.description;
  result.confidence_score = to_confidence(best->fused_score);
  result.match_reason = explain(*best);
  result.breakdown = domain::ScoreBreakdown{
      .text = best->text_score,
      .attribute = best->attribute_score,
      .fused = best->fused_score,
  };

  return result;
}

}  // namespace catmatch::matching
