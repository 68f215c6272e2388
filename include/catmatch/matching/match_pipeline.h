#pragma once

#include "catmatch/domain/catalog_item.h"
#include "catmatch/domain/match_result.h"
#include "catmatch/domain/unstructured_item.h"
#include "catmatch/matching/match_scorer.h"
#include "catmatch/similarity/similarity_engine.h"

#include <cstddef>
#include <vector>

namespace catmatch::matching {

struct PipelineOptions {
  // Number of scoring workers. Values <= 1 score on the calling thread.
  // Capped at the hardware thread count and at the number of items.
  std::size_t worker_threads{1};
};

// effective_worker_count clamps a requested worker count to [1, item_count]
// and, when hardware_threads is non-zero, to hardware_threads.
[[nodiscard]] std::size_t effective_worker_count(std::size_t requested, std::size_t item_count,
                                                 std::size_t hardware_threads);

// MatchPipeline produces one MatchResult per unstructured item, in input order.
//
// Entry checks (std::invalid_argument):
// - matrix rows == unstructured count, matrix cols == catalog count
// - catalog ids unique, unstructured ids unique
//
// Failures are not partial: a similarity failure or a failure while scoring
// any item propagates out of run() and no results are returned.
class MatchPipeline {
 public:
  MatchPipeline(const similarity::ISimilarityEngine& engine, MatcherConfig config = MatcherConfig{},
                PipelineOptions options = PipelineOptions{});

  // Computes the similarity matrix from the cached normalized descriptions, then scores.
  [[nodiscard]] std::vector<domain::MatchResult> run(
      const std::vector<domain::CatalogItem>& catalog,
      const std::vector<domain::UnstructuredItem>& unstructured) const;

  // Scores against an externally computed matrix.
  [[nodiscard]] std::vector<domain::MatchResult> run(
      const std::vector<domain::CatalogItem>& catalog,
      const std::vector<domain::UnstructuredItem>& unstructured,
      const similarity::SimilarityMatrix& matrix) const;

  // compute_similarity runs the engine over the items' normalized descriptions.
  [[nodiscard]] similarity::SimilarityMatrix compute_similarity(
      const std::vector<domain::CatalogItem>& catalog,
      const std::vector<domain::UnstructuredItem>& unstructured) const;

 private:
  const similarity::ISimilarityEngine& engine_;
  MatchScorer scorer_;
  PipelineOptions options_;
};

// check_pipeline_preconditions throws std::invalid_argument on shape mismatch
// or duplicate ids.
void check_pipeline_preconditions(const std::vector<domain::CatalogItem>& catalog,
                                  const std::vector<domain::UnstructuredItem>& unstructured,
                                  const similarity::SimilarityMatrix& matrix);

}  // namespace catmatch::matching
