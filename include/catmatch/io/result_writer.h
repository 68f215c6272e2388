#pragma once

#include "catmatch/core/result.h"
#include "catmatch/domain/match_result.h"
#include "catmatch/io/csv.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace catmatch::io {

// Column order of the results CSV
inline constexpr const char* kResultColumns[] = {
    "Unstructured_ID",     "Original_Description", "Matched_Product_ID",
    "Matched_Description", "Confidence_Score",     "Match_Reason",
};

// format_confidence renders a score with exactly two decimals ("93.67", "0.00").
[[nodiscard]] std::string format_confidence(double confidence_score);

// format_results_csv renders the header plus one row per result, in order.
// A missing match leaves the matched id and description cells empty.
[[nodiscard]] std::string format_results_csv(const std::vector<domain::MatchResult>& results);

[[nodiscard]] core::Result<bool, IoError> write_results_csv(
    const std::string& path, const std::vector<domain::MatchResult>& results);

// results_to_json renders the same fields as the CSV (null for a missing
// match) plus the score breakdown and candidates_considered.
[[nodiscard]] nlohmann::json results_to_json(const std::vector<domain::MatchResult>& results);

[[nodiscard]] core::Result<bool, IoError> write_results_json(
    const std::string& path, const std::vector<domain::MatchResult>& results);

}  // namespace catmatch::io
