#pragma once

#include "catmatch/app/run_trace.h"
#include "catmatch/core/services.h"
#include "catmatch/domain/catalog_item.h"
#include "catmatch/domain/match_result.h"
#include "catmatch/domain/unstructured_item.h"
#include "catmatch/extraction/attribute_extractor.h"
#include "catmatch/matching/match_pipeline.h"
#include "catmatch/matching/matcher_config.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace catmatch::app {

// ────────────────────────────────────────────────────────────────
// Match Pipeline
// ────────────────────────────────────────────────────────────────

struct MatchPipelineRequest {
  // Catalog to match against; when absent the catalog repository is listed
  std::optional<std::vector<domain::CatalogRecord>> catalog;  // NOLINT(readability-identifier-naming)

  std::vector<domain::UnstructuredRecord> unstructured;  // NOLINT(readability-identifier-naming)

  matching::MatcherConfig config{};                      // NOLINT(readability-identifier-naming)
  matching::PipelineOptions options{};                   // NOLINT(readability-identifier-naming)
  extraction::AttributePatterns patterns{
      extraction::default_attribute_patterns()};         // NOLINT(readability-identifier-naming)

  // Where the inputs came from (file paths, table names); recorded as RunStarted refs
  std::vector<std::string> input_refs;  // NOLINT(readability-identifier-naming)
};

struct MatchRunSummary {
  std::size_t catalog_count{0};       // NOLINT(readability-identifier-naming)
  std::size_t unstructured_count{0};  // NOLINT(readability-identifier-naming)
  std::size_t matched_count{0};       // NOLINT(readability-identifier-naming)
  double mean_confidence{0.0};        // NOLINT(readability-identifier-naming)
};

struct MatchPipelineResponse {
  std::string trace_id;                      // NOLINT(readability-identifier-naming)
  std::vector<domain::MatchResult> results;  // NOLINT(readability-identifier-naming)
  MatchRunSummary summary;                   // NOLINT(readability-identifier-naming)
};

// Run extraction, similarity and scoring over one batch.
// Emits audit events through `trace`: RunStarted (refs: req.input_refs),
// SimilarityComputed, MatchCompleted (refs: matched catalog ids, sorted and
// unique), RunCompleted.
//
// Throws std::runtime_error if the catalog repository cannot be listed, and
// propagates std::invalid_argument / similarity::VectorizationError from the
// pipeline. No RunCompleted event is written for a failed run.
[[nodiscard]] MatchPipelineResponse run_match_pipeline(const MatchPipelineRequest& req,
                                                       core::Services& services,
                                                       RunTrace& trace);

// summarize computes the counts and mean confidence of a result batch.
[[nodiscard]] MatchRunSummary summarize(std::size_t catalog_count,
                                        const std::vector<domain::MatchResult>& results);

}  // namespace catmatch::app
