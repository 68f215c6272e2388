#pragma once

#include "catmatch/domain/attribute_set.h"
#include "catmatch/domain/catalog_item.h"
#include "catmatch/domain/match_result.h"
#include "catmatch/domain/unstructured_item.h"
#include "catmatch/matching/matcher_config.h"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace catmatch::matching {

// AttributeAgreement compares two attribute sets kind by kind.
// Only kinds present on both sides are comparable; every equal comparable
// value adds a "<Kind>: <value>" fragment, in AttributeKind order.
struct AttributeAgreement {
  std::size_t comparable_count{0};
  std::size_t match_count{0};
  std::vector<std::string> reason_fragments;

  // match_count / comparable_count, or 0 when nothing was comparable.
  [[nodiscard]] double score() const;
};

[[nodiscard]] AttributeAgreement compare_attributes(const domain::AttributeSet& unstructured,
                                                    const domain::AttributeSet& catalog);

// CandidateScore is the transient score of one (unstructured, catalog) pair.
struct CandidateScore {
  std::size_t catalog_index{0};
  double text_score{0.0};
  double attribute_score{0.0};
  double fused_score{0.0};
  std::vector<std::string> reason_fragments;
};

// select_candidates returns up to top_k catalog indices ordered by descending
// similarity; equal similarities are ordered by ascending catalog index.
[[nodiscard]] std::vector<std::size_t> select_candidates(std::span<const double> similarity_row,
                                                         std::size_t top_k);

// to_confidence converts a fused score to a 0-100 confidence, rounded to two
// decimals.
[[nodiscard]] double to_confidence(double fused_score);

// MatchScorer picks the best catalog entry for one unstructured item.
// The configuration is fixed at construction and score() is const, so a
// single scorer may be shared by concurrent workers.
// The constructor throws std::invalid_argument if the config fails validate().
class MatchScorer {
 public:
  explicit MatchScorer(MatcherConfig config = MatcherConfig{});

  // Algorithm:
  // 1. prune to the top_k most similar catalog items
  // 2. score attribute agreement for each candidate
  // 3. fused = weights.text * text + weights.attribute * attribute
  // 4. keep the first candidate with the highest fused score (strict >),
  //    so equal scores resolve in favour of the more similar candidate
  // 5. explain the winner by its attribute fragments, else by text
  //    similarity, else as a low-confidence match
  //
  // Throws std::invalid_argument if similarity_row.size() != catalog.size().
  [[nodiscard]] domain::MatchResult score(const domain::UnstructuredItem& item,
                                          const std::vector<domain::CatalogItem>& catalog,
                                          std::span<const double> similarity_row) const;

  [[nodiscard]] CandidateScore score_candidate(const domain::UnstructuredItem& item,
                                               const domain::CatalogItem& candidate,
                                               std::size_t catalog_index,
                                               double text_score) const;

  [[nodiscard]] const MatcherConfig& config() const { return config_; }

 private:
  MatcherConfig config_;

  [[nodiscard]] std::string explain(const CandidateScore& winner) const;
};

}  // namespace catmatch::matching
