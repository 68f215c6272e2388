#pragma once

#include "catmatch/core/ids.h"

#include <cstddef>
#include <optional>
#include <string>

namespace catmatch::domain {

inline constexpr const char* kHighTextSimilarityReason = "High Text Similarity";
inline constexpr const char* kLowConfidenceReason = "Low Confidence Match";

// ScoreBreakdown records the components of the winning candidate's score.
struct ScoreBreakdown {
  double text{0.0};
  double attribute{0.0};
  double fused{0.0};
};

// MatchResult is the outcome for one unstructured item.
// matched_catalog_id is empty iff the candidate pool was empty; a weak match
// is still reported as a match with a low confidence_score.
struct MatchResult {
  core::UnstructuredId unstructured_id;
  std::string original_description;
  std::optional<core::CatalogId> matched_catalog_id;
  std::optional<std::string> matched_description;
  double confidence_score{0.0};  // 0-100, two decimals
  std::string match_reason{kLowConfidenceReason};

  ScoreBreakdown breakdown;
  std::size_t candidates_considered{0};
};

}  // namespace catmatch::domain
