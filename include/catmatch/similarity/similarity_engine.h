#pragma once

#include "catmatch/similarity/similarity_matrix.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace catmatch::similarity {

// VectorizationError reports that no vector space could be built from the
// catalog corpus (e.g. every catalog description is empty or stop words only).
// It is not recoverable inside the matcher and propagates to the caller.
class VectorizationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// ISimilarityEngine is the boundary to the text-vectorization layer.
// Implementations fit their vector space on the catalog corpus only and
// project the unstructured documents into it.
//
// Contract:
// - result.rows() == unstructured_docs.size(), result.cols() == catalog_docs.size()
// - every value is in [0, 1]; 1.0 means an identical term profile
// - deterministic for identical input
class ISimilarityEngine {
 public:
  virtual ~ISimilarityEngine() = default;

  [[nodiscard]] virtual SimilarityMatrix compute(
      const std::vector<std::string>& catalog_docs,
      const std::vector<std::string>& unstructured_docs) const = 0;
};

}  // namespace catmatch::similarity
