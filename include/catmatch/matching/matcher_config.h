#pragma once

#include "catmatch/core/result.h"

#include <cstddef>
#include <string>

namespace catmatch::matching {

// ScoreWeights fuses the two evidence sources: fused = text * s + attribute * a.
// The weights must sum to 1.0 so that the fused score stays in [0, 1].
struct ScoreWeights {
  double text{0.60};
  double attribute{0.40};
};

// MatcherConfig is the immutable scoring configuration handed to MatchScorer.
struct MatcherConfig {
  ScoreWeights weights{};
  std::size_t top_k{5};               // Candidates kept after similarity pruning
  double high_text_similarity{0.7};   // Above this, an attribute-less win reads as text-driven

  // validate checks invariants.
  // Returns ok(true) if valid, err(message) if invalid.
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

// to_json serializes a MatcherConfig. Keys are sorted alphabetically and the
// output is deterministic given the same input.
[[nodiscard]] std::string to_json(const MatcherConfig& config);

// matcher_config_from_json parses a MatcherConfig. Absent keys keep their
// defaults. Throws std::runtime_error on malformed JSON or wrong value types.
[[nodiscard]] MatcherConfig matcher_config_from_json(const std::string& json_str);

}  // namespace catmatch::matching
