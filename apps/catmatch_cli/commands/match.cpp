#include "match.h"

#include "catmatch/app/app_service.h"
#include "catmatch/core/services.h"
#include "catmatch/io/record_loader.h"
#include "catmatch/io/result_writer.h"
#include "catmatch/matching/matcher_config.h"
#include "catmatch/report/confidence_histogram.h"
#include "catmatch/similarity/tfidf_similarity_engine.h"
#include "catmatch/storage/audit_log.h"
#include "catmatch/storage/inmemory_catalog_repository.h"
#include "catmatch/storage/sqlite/sqlite_catalog_repository.h"
#include "catmatch/storage/sqlite/sqlite_db.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct MatchCliConfig {
  std::optional<std::string> catalog_csv;
  std::optional<std::string> catalog_db;
  std::optional<std::string> unstructured_csv;
  std::string output{"matching_results.csv"};
  std::optional<std::string> json_output;
  std::optional<std::string> config_path;
  std::size_t threads{1};
  std::optional<std::size_t> top_k;
  catmatch::io::CatalogCsvColumns catalog_columns;
  bool deterministic{false};
};

bool parse_count(const std::string& flag, const std::string& value, std::size_t& out) {
  try {
    std::size_t consumed = 0;
    const unsigned long parsed = std::stoul(value, &consumed);
    if (consumed != value.size() || value.front() == '-') {
      throw std::invalid_argument(value);
    }
    out = parsed;
    return true;
  } catch (const std::exception&) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected a non-negative integer)\n";
    return false;
  }
}

catmatch::matching::MatcherConfig load_matcher_config(const MatchCliConfig& cli) {
  catmatch::matching::MatcherConfig config;
  if (cli.config_path.has_value()) {
    std::ifstream file(cli.config_path.value());
    if (!file) {
      throw std::runtime_error("Could not open config file: " + cli.config_path.value());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    config = catmatch::matching::matcher_config_from_json(buffer.str());
  }
  if (cli.top_k.has_value()) {
    config.top_k = cli.top_k.value();
  }
  return config;
}

void print_audit_trail(const catmatch::storage::IAuditLog& audit_log, const std::string& trace_id) {
  std::cout << "\n--- Audit Trail (trace_id=" << trace_id << ") ---\n";
  for (const auto& event : audit_log.query(trace_id)) {
    std::cout << event.created_at << " [" << event.event_type << "] " << event.payload;
    if (!event.refs.empty()) {
      std::cout << " refs=" << nlohmann::json(event.refs).dump();
    }
    std::cout << "\n";
  }
}

// Runs the pipeline against whichever catalog repository the caller opened.
// catalog holds the CSV records when the catalog did not come from the
// repository.
int run_match(const MatchCliConfig& cli, catmatch::storage::ICatalogRepository& repository,
              std::optional<std::vector<catmatch::domain::CatalogRecord>> catalog) {
  auto unstructured = catmatch::io::load_unstructured_csv(cli.unstructured_csv.value());
  if (!unstructured.has_value()) {
    std::cerr << "Failed to load unstructured descriptions: " << unstructured.error().message
              << "\n";
    return 1;
  }

  catmatch::app::MatchPipelineRequest request;
  request.catalog = std::move(catalog);
  request.unstructured = std::move(unstructured.value());
  request.config = load_matcher_config(cli);
  request.options.worker_threads = cli.threads;
  request.input_refs.push_back(cli.catalog_db.has_value() ? cli.catalog_db.value()
                                                          : cli.catalog_csv.value_or(""));
  request.input_refs.push_back(cli.unstructured_csv.value());

  catmatch::storage::InMemoryAuditLog audit_log;
  const catmatch::similarity::TfidfSimilarityEngine engine;
  catmatch::core::Services services{repository, audit_log, engine};

  // --deterministic pins ids and timestamps so that two runs print the same trail
  auto trace = cli.deterministic
                   ? catmatch::app::RunTrace::fixed("run-0", "2026-01-01T00:00:00Z")
                   : catmatch::app::RunTrace::from_wall_clock();

  std::cout << "Matching " << request.unstructured.size() << " unstructured items...\n";
  const auto response = catmatch::app::run_match_pipeline(request, services, trace);

  auto written = catmatch::io::write_results_csv(cli.output, response.results);
  if (!written.has_value()) {
    std::cerr << "Failed to write results: " << written.error().message << "\n";
    return 1;
  }
  std::cout << "Results saved to " << cli.output << "\n";

  if (cli.json_output.has_value()) {
    auto json_written = catmatch::io::write_results_json(cli.json_output.value(), response.results);
    if (!json_written.has_value()) {
      std::cerr << "Failed to write JSON results: " << json_written.error().message << "\n";
      return 1;
    }
    std::cout << "JSON results saved to " << cli.json_output.value() << "\n";
  }

  const auto histogram = catmatch::report::build_confidence_histogram(response.results);
  nlohmann::json out;
  out["catalog_count"] = response.summary.catalog_count;
  out["unstructured_count"] = response.summary.unstructured_count;
  out["matched_count"] = response.summary.matched_count;
  out["mean_confidence"] = response.summary.mean_confidence;
  out["confidence_distribution"] = catmatch::report::to_json(histogram);
  std::cout << out.dump(2) << "\n";

  print_audit_trail(audit_log, response.trace_id);
  return 0;
}

}  // namespace

int cmd_match(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<catmatch::apps::Option<MatchCliConfig>> options = {
      {"--catalog", true, "Catalog CSV (Product_ID, Description)",
       [](MatchCliConfig& c, const std::string& v) {
         c.catalog_csv = v;
         return true;
       }},
      {"--catalog-db", true, "SQLite catalog database written by import-catalog",
       [](MatchCliConfig& c, const std::string& v) {
         c.catalog_db = v;
         return true;
       }},
      {"--unstructured", true, "Unstructured descriptions CSV (description, optional id)",
       [](MatchCliConfig& c, const std::string& v) {
         c.unstructured_csv = v;
         return true;
       }},
      {"--output", true, "Results CSV path (default matching_results.csv)",
       [](MatchCliConfig& c, const std::string& v) {
         c.output = v;
         return true;
       }},
      {"--json-output", true, "Also write results as JSON to this path",
       [](MatchCliConfig& c, const std::string& v) {
         c.json_output = v;
         return true;
       }},
      {"--config", true, "Matcher configuration JSON file",
       [](MatchCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--threads", true, "Scoring worker threads (default 1)",
       [](MatchCliConfig& c, const std::string& v) {
         return parse_count("--threads", v, c.threads);
       }},
      {"--top-k", true, "Candidates kept after similarity pruning (overrides --config)",
       [](MatchCliConfig& c, const std::string& v) {
         std::size_t k = 0;
         if (!parse_count("--top-k", v, k)) {
           return false;
         }
         c.top_k = k;
         return true;
       }},
      {"--id-column", true, "Catalog CSV id column (default Product_ID)",
       [](MatchCliConfig& c, const std::string& v) {
         c.catalog_columns.id = v;
         return true;
       }},
      {"--description-column", true, "Catalog CSV description column (default Description)",
       [](MatchCliConfig& c, const std::string& v) {
         c.catalog_columns.description = v;
         return true;
       }},
      {"--deterministic", false, "Use sequential ids and a fixed clock for the audit trail",
       [](MatchCliConfig& c, const std::string&) {
         c.deterministic = true;
         return true;
       }},
  };

  std::vector<std::string> positional;
  auto parsed = catmatch::apps::parse_options(argc, argv, options, positional, 2);
  const bool one_catalog_source =
      parsed.has_value() && (parsed->catalog_csv.has_value() != parsed->catalog_db.has_value());
  if (!parsed.has_value() || !positional.empty() || !one_catalog_source ||
      !parsed->unstructured_csv.has_value()) {
    std::cerr << "Usage: catmatch_cli match --unstructured <csv> "
                 "(--catalog <csv> | --catalog-db <db>) [options]\n";
    catmatch::apps::print_options(std::cerr, options);
    return 1;
  }
  const auto& config = parsed.value();

  try {
    if (config.catalog_db.has_value()) {
      auto db_result = catmatch::storage::sqlite::SqliteDb::open(config.catalog_db.value());
      if (!db_result.has_value()) {
        std::cerr << "Failed to open database: " << db_result.error() << "\n";
        return 1;
      }

      auto db = db_result.value();
      auto schema_result = db->ensure_schema_v1();
      if (!schema_result.has_value()) {
        std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
        return 1;
      }

      std::cout << "Using SQLite catalog: " << config.catalog_db.value() << "\n";
      catmatch::storage::sqlite::SqliteCatalogRepository repository(db);
      return run_match(config, repository, std::nullopt);
    }

    auto catalog = catmatch::io::load_catalog_csv(config.catalog_csv.value(),
                                                  config.catalog_columns);
    if (!catalog.has_value()) {
      std::cerr << "Failed to load catalog: " << catalog.error().message << "\n";
      return 1;
    }
    std::cout << "Loaded " << catalog.value().size() << " catalog items\n";

    catmatch::storage::InMemoryCatalogRepository repository;
    return run_match(config, repository, std::move(catalog.value()));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
