#include "catmatch/report/confidence_histogram.h"

#include <algorithm>
#include <stdexcept>

namespace catmatch::report {

double ConfidenceHistogram::bin_width() const {
  if (counts.empty()) {
    return 0.0;
  }
  return (range_max - range_min) / static_cast<double>(counts.size());
}

double ConfidenceHistogram::bin_lower(const std::size_t bin) const {
  return range_min + bin_width() * static_cast<double>(bin);
}

ConfidenceHistogram build_confidence_histogram(const std::vector<domain::MatchResult>& results,
                                               const std::size_t bins) {
  if (bins == 0) {
    throw std::invalid_argument("histogram needs at least one bin");
  }

  ConfidenceHistogram histogram;
  histogram.counts.assign(bins, 0);
  histogram.total = results.size();
  if (results.empty()) {
    return histogram;
  }

  const double width = histogram.bin_width();
  double sum = 0.0;
  histogram.min = results.front().confidence_score;
  histogram.max = results.front().confidence_score;

  for (const auto& result : results) {
    const double score = result.confidence_score;
    sum += score;
    histogram.min = std::min(histogram.min, score);
    histogram.max = std::max(histogram.max, score);

    const double clamped = std::clamp(score, histogram.range_min, histogram.range_max);
    auto bin = static_cast<std::size_t>((clamped - histogram.range_min) / width);
    if (bin >= bins) {
      bin = bins - 1;  // 100 belongs to the last bin
    }
    ++histogram.counts[bin];
  }

  histogram.mean = sum / static_cast<double>(results.size());
  return histogram;
}

nlohmann::json to_json(const ConfidenceHistogram& histogram) {
  nlohmann::json bins = nlohmann::json::array();
  for (std::size_t i = 0; i < histogram.counts.size(); ++i) {
    bins.push_back({
        {"count", histogram.counts[i]},
        {"lower", histogram.bin_lower(i)},
        {"upper", histogram.bin_lower(i) + histogram.bin_width()},
    });
  }

  nlohmann::json j;
  j["bins"] = bins;
  j["max"] = histogram.max;
  j["mean"] = histogram.mean;
  j["min"] = histogram.min;
  j["total"] = histogram.total;
  return j;
}

}  // namespace catmatch::report
