#include "catmatch/app/app_service.h"

#include "catmatch/extraction/item_builder.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

namespace catmatch::app {

MatchRunSummary summarize(const std::size_t catalog_count,
                          const std::vector<domain::MatchResult>& results) {
  MatchRunSummary summary;
  summary.catalog_count = catalog_count;
  summary.unstructured_count = results.size();

  double total_confidence = 0.0;
  for (const auto& result : results) {
    if (result.matched_catalog_id.has_value()) {
      ++summary.matched_count;
    }
    total_confidence += result.confidence_score;
  }
  if (!results.empty()) {
    summary.mean_confidence = total_confidence / static_cast<double>(results.size());
  }

  return summary;
}

namespace {

std::vector<std::string> matched_catalog_ids(const std::vector<domain::MatchResult>& results) {
  std::vector<std::string> ids;
  for (const auto& result : results) {
    if (result.matched_catalog_id.has_value()) {
      ids.push_back(result.matched_catalog_id->value);
    }
  }
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

}  // namespace

MatchPipelineResponse run_match_pipeline(const MatchPipelineRequest& req, core::Services& services,
                                         RunTrace& trace) {
  // Resolve catalog
  std::vector<domain::CatalogRecord> catalog_records;
  std::string catalog_source = "request";
  if (req.catalog.has_value()) {
    catalog_records = req.catalog.value();
  } else {
    auto listed = services.catalog.list_all();
    if (!listed.has_value()) {
      throw std::runtime_error("Failed to list catalog: " + listed.error());
    }
    catalog_records = std::move(listed.value());
    catalog_source = "repository";
  }

  services.audit_log.append(
      trace.event("RunStarted",
                  nlohmann::json{
                      {"catalog_count", catalog_records.size()},
                      {"catalog_source", catalog_source},
                      {"config", nlohmann::json::parse(matching::to_json(req.config))},
                      {"unstructured_count", req.unstructured.size()},
                  },
                  req.input_refs));

  // Extraction runs once per item; the pipeline reads the cached fields
  const extraction::AttributeExtractor extractor(req.patterns);
  const auto catalog = extraction::build_catalog_items(catalog_records, extractor);
  const auto unstructured = extraction::build_unstructured_items(req.unstructured, extractor);

  const matching::MatchPipeline pipeline(services.similarity, req.config, req.options);
  const auto matrix = pipeline.compute_similarity(catalog, unstructured);

  services.audit_log.append(trace.event("SimilarityComputed", nlohmann::json{
                                                                 {"cols", matrix.cols()},
                                                                 {"rows", matrix.rows()},
                                                             }));

  auto results = pipeline.run(catalog, unstructured, matrix);
  const auto summary = summarize(catalog.size(), results);

  services.audit_log.append(trace.event("MatchCompleted",
                                        nlohmann::json{
                                            {"matched_count", summary.matched_count},
                                            {"mean_confidence", summary.mean_confidence},
                                            {"result_count", results.size()},
                                        },
                                        matched_catalog_ids(results)));

  services.audit_log.append(trace.event("RunCompleted", nlohmann::json{{"status", "success"}}));

  return MatchPipelineResponse{
      .trace_id = trace.trace_id(),
      .results = std::move(results),
      .summary = summary,
  };
}

}  // namespace catmatch::app
