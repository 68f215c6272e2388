#pragma once

#include "catmatch/domain/match_result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace catmatch::report {

// ConfidenceHistogram summarizes the distribution of confidence scores.
// Bins split [0, 100] into equal-width intervals [lo, hi); the last bin also
// contains 100. Scores outside [0, 100] are clamped into the end bins.
struct ConfidenceHistogram {
  double range_min{0.0};
  double range_max{100.0};
  std::vector<std::size_t> counts;

  std::size_t total{0};
  double mean{0.0};  // 0 when total == 0
  double min{0.0};
  double max{0.0};

  [[nodiscard]] double bin_width() const;
  [[nodiscard]] double bin_lower(std::size_t bin) const;
};

// Throws std::invalid_argument when bins == 0.
[[nodiscard]] ConfidenceHistogram build_confidence_histogram(
    const std::vector<domain::MatchResult>& results, std::size_t bins = 20);

[[nodiscard]] nlohmann::json to_json(const ConfidenceHistogram& histogram);

}  // namespace catmatch::report
