#pragma once

#include <string>
#include <unordered_set>

namespace catmatch::similarity {

// english_stop_words returns the fixed English stop-word list removed before
// TF-IDF weighting. Deterministic list for reproducible vocabularies.
[[nodiscard]] const std::unordered_set<std::string>& english_stop_words();

}  // namespace catmatch::similarity
