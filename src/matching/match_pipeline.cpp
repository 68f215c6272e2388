#include "catmatch/matching/match_pipeline.h"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace catmatch::matching {

namespace {

// Scores items [begin, end) into their own result slots.
void score_range(const MatchScorer& scorer, const std::vector<domain::CatalogItem>& catalog,
                 const std::vector<domain::UnstructuredItem>& unstructured,
                 const similarity::SimilarityMatrix& matrix,
                 std::vector<domain::MatchResult>& results, std::size_t begin, std::size_t end) {
  for (std::size_t i = begin; i < end; ++i) {
    results[i] = scorer.score(unstructured[i], catalog, matrix.row(i));
  }
}

}  // namespace

std::size_t effective_worker_count(const std::size_t requested, const std::size_t item_count,
                                   const std::size_t hardware_threads) {
  std::size_t workers = std::max<std::size_t>(requested, 1);
  if (hardware_threads > 0) {
    workers = std::min(workers, hardware_threads);
  }
  return std::min(workers, std::max<std::size_t>(item_count, 1));
}

void check_pipeline_preconditions(const std::vector<domain::CatalogItem>& catalog,
                                  const std::vector<domain::UnstructuredItem>& unstructured,
                                  const similarity::SimilarityMatrix& matrix) {
  if (matrix.rows() != unstructured.size() || matrix.cols() != catalog.size()) {
    throw std::invalid_argument(
        "similarity matrix shape " + std::to_string(matrix.rows()) + "x" +
        std::to_string(matrix.cols()) + " does not match " + std::to_string(unstructured.size()) +
        " unstructured items x " + std::to_string(catalog.size()) + " catalog items");
  }

  std::set<core::CatalogId> catalog_ids;
  for (const auto& item : catalog) {
    if (!catalog_ids.insert(item.id).second) {
      throw std::invalid_argument("duplicate catalog id: " + item.id.value);
    }
  }

  std::set<core::UnstructuredId> unstructured_ids;
  for (const auto& item : unstructured) {
    if (!unstructured_ids.insert(item.id).second) {
      throw std::invalid_argument("duplicate unstructured id: " + item.id.value);
    }
  }
}

MatchPipeline::MatchPipeline(const similarity::ISimilarityEngine& engine, MatcherConfig config,
                             PipelineOptions options)
    : engine_(engine), scorer_(config), options_(options) {}

similarity::SimilarityMatrix MatchPipeline::compute_similarity(
    const std::vector<domain::CatalogItem>& catalog,
    const std::vector<domain::UnstructuredItem>& unstructured) const {
  std::vector<std::string> catalog_docs;
  catalog_docs.reserve(catalog.size());
  for (const auto& item : catalog) {
    catalog_docs.push_back(item.normalized_description);
  }

  std::vector<std::string> unstructured_docs;
  unstructured_docs.reserve(unstructured.size());
  for (const auto& item : unstructured) {
    unstructured_docs.push_back(item.normalized_description);
  }

  return engine_.compute(catalog_docs, unstructured_docs);
}

std::vector<domain::MatchResult> MatchPipeline::run(
    const std::vector<domain::CatalogItem>& catalog,
    const std::vector<domain::UnstructuredItem>& unstructured) const {
  const auto matrix = compute_similarity(catalog, unstructured);
  return run(catalog, unstructured, matrix);
}

std::vector<domain::MatchResult> MatchPipeline::run(
    const std::vector<domain::CatalogItem>& catalog,
    const std::vector<domain::UnstructuredItem>& unstructured,
    const similarity::SimilarityMatrix& matrix) const {
  check_pipeline_preconditions(catalog, unstructured, matrix);

  std::vector<domain::MatchResult> results(unstructured.size());

  const std::size_t workers = effective_worker_count(options_.worker_threads, unstructured.size(),
                                                     std::thread::hardware_concurrency());
  if (workers == 1) {
    score_range(scorer_, catalog, unstructured, matrix, results, 0, unstructured.size());
    return results;
  }

  // Contiguous chunks, one per worker; each worker writes only its own slots.
  // If spawning fails part way, the jthreads already started are joined
  // before the std::system_error leaves this function.
  std::vector<std::exception_ptr> errors(workers);
  std::vector<std::jthread> threads;
  threads.reserve(workers);

  const std::size_t chunk = (unstructured.size() + workers - 1) / workers;
  for (std::size_t w = 0; w < workers; ++w) {
    const std::size_t begin = std::min(w * chunk, unstructured.size());
    const std::size_t end = std::min(begin + chunk, unstructured.size());
    threads.emplace_back([&, w, begin, end]() {
      try {
        score_range(scorer_, catalog, unstructured, matrix, results, begin, end);
      } catch (...) {
        errors[w] = std::current_exception();
      }
    });
  }

  threads.clear();

  for (const auto& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  return results;
}

}  // namespace catmatch::matching
