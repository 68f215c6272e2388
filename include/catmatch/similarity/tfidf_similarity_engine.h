#pragma once

#include "catmatch/similarity/similarity_engine.h"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace catmatch::similarity {

// SparseVector holds (term_id, weight) pairs sorted by term_id.
using SparseVector = std::vector<std::pair<std::uint32_t, double>>;

struct TfidfOptions {
  bool filter_stop_words{true};
  std::size_t min_token_length{2};
};

// TfidfModel is a vocabulary plus smoothed IDF weights fit on one corpus.
// Once fit it is read-only; transform() projects any document into the
// fitted space and ignores terms outside the vocabulary.
class TfidfModel {
 public:
  // Throws VectorizationError if the corpus is non-empty but yields no terms.
  static TfidfModel fit(const std::vector<std::string>& corpus, const TfidfOptions& options);

  // L2-normalized TF-IDF vector (raw counts x idf). Empty if no known terms.
  [[nodiscard]] SparseVector transform(const std::string& document) const;

  [[nodiscard]] std::size_t vocabulary_size() const { return terms_.size(); }
  [[nodiscard]] double idf(const std::string& term) const;

 private:
  TfidfModel(TfidfOptions options, std::map<std::string, std::uint32_t> term_to_id,
             std::vector<std::string> terms, std::vector<double> idf);

  TfidfOptions options_;
  std::map<std::string, std::uint32_t> term_to_id_;
  std::vector<std::string> terms_;  // term_id -> term
  std::vector<double> idf_;         // term_id -> idf
};

// analyze_document tokenizes a document the way the model sees it:
// normalized word tokens of at least min_token_length bytes, stop words removed.
[[nodiscard]] std::vector<std::string> analyze_document(const std::string& document,
                                                        const TfidfOptions& options);

// cosine_similarity of two L2-normalized sparse vectors, clamped to [0, 1].
[[nodiscard]] double cosine_similarity(const SparseVector& a, const SparseVector& b);

// TfidfSimilarityEngine fits TF-IDF on the catalog corpus and scores every
// unstructured document against every catalog document by cosine similarity.
// An empty catalog yields a matrix with zero columns.
class TfidfSimilarityEngine final : public ISimilarityEngine {
 public:
  explicit TfidfSimilarityEngine(TfidfOptions options = TfidfOptions{});

  [[nodiscard]] SimilarityMatrix compute(
      const std::vector<std::string>& catalog_docs,
      const std::vector<std::string>& unstructured_docs) const override;

 private:
  TfidfOptions options_;
};

}  // namespace catmatch::similarity
