#include "catmatch/extraction/attribute_extractor.h"
#include "catmatch/extraction/item_builder.h"
#include "catmatch/io/record_loader.h"
#include "catmatch/matching/match_pipeline.h"
#include "catmatch/similarity/tfidf_similarity_engine.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace catmatch;

namespace {

const std::vector<domain::CatalogRecord> kCatalog{
    {core::CatalogId{"P-100"}, "Nike Black Running Shoes Men"},
    {core::CatalogId{"P-101"}, "Adidas White Hoodie XL Unisex"},
    {core::CatalogId{"P-102"}, "Levi's Blue Jeans 32 Men"},
    {core::CatalogId{"P-103"}, "Zara Red Summer Dress Women"},
    {core::CatalogId{"P-104"}, "Converse Grey Sneakers Kids"},
    {core::CatalogId{"P-105"}, "Gucci Brown Leather Belt"},
    {core::CatalogId{"P-106"}, "H&M Navy Sandals Women"},
};

std::vector<domain::UnstructuredRecord> make_batch() {
  const std::vector<std::string> descriptions{
      "nike black running shoe for men", "white adidas hoodie size xl",
      "levis jeans blue 32",              "red summer dress zara women",
      "kids grey converse sneakers",      "brown gucci belt leather",
      "naavy santals h&m women",          "completely unrelated text xyz",
      "",                                 "prada winter coat",
      "black nike shoes",                 "blue jeans men",
  };
  std::vector<domain::UnstructuredRecord> records;
  for (const auto& description : descriptions) {
    records.push_back({std::nullopt, description});
  }
  return records;
}

// Returns a fixed-shape matrix regardless of input
class FixedShapeEngine final : public similarity::ISimilarityEngine {
 public:
  FixedShapeEngine(std::size_t rows, std::size_t cols) : rows_(rows), cols_(cols) {}

  [[nodiscard]] similarity::SimilarityMatrix compute(
      const std::vector<std::string>& /*catalog_docs*/,
      const std::vector<std::string>& /*unstructured_docs*/) const override {
    return similarity::SimilarityMatrix(rows_, cols_);
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
};

void require_same_results(const std::vector<domain::MatchResult>& a,
                          const std::vector<domain::MatchResult>& b) {
  REQUIRE(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    CHECK(a[i].unstructured_id == b[i].unstructured_id);
    CHECK(a[i].matched_catalog_id == b[i].matched_catalog_id);
    CHECK(a[i].confidence_score == b[i].confidence_score);
    CHECK(a[i].match_reason == b[i].match_reason);
    CHECK(a[i].candidates_considered == b[i].candidates_considered);
  }
}

}  // namespace

TEST_CASE("MatchPipeline returns one result per item in input order", "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const auto catalog = extraction::build_catalog_items(kCatalog, extractor);
  const auto unstructured = extraction::build_unstructured_items(make_batch(), extractor);

  const similarity::TfidfSimilarityEngine engine;
  const matching::MatchPipeline pipeline(engine);
  const auto results = pipeline.run(catalog, unstructured);

  REQUIRE(results.size() == unstructured.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    CHECK(results[i].unstructured_id.value == std::to_string(i));
    CHECK(results[i].confidence_score >= 0.0);
    CHECK(results[i].confidence_score <= 100.0);
    CHECK(results[i].matched_catalog_id.has_value());
  }

  CHECK(results[0].matched_catalog_id->value == "P-100");
  CHECK(results[3].matched_catalog_id->value == "P-103");
  CHECK(results[6].matched_catalog_id->value == "P-106");
  CHECK(results[7].match_reason == "Low Confidence Match");
}

TEST_CASE("MatchPipeline with an empty catalog reports no matches", "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const std::vector<domain::CatalogItem> catalog;
  const auto unstructured = extraction::build_unstructured_items({{std::nullopt, "anything"}},
                                                                 extractor);

  const similarity::TfidfSimilarityEngine engine;
  const auto results = matching::MatchPipeline(engine).run(catalog, unstructured);

  REQUIRE(results.size() == 1);
  CHECK_FALSE(results[0].matched_catalog_id.has_value());
  CHECK(results[0].confidence_score == 0.0);
  CHECK(results[0].match_reason == "Low Confidence Match");
}

TEST_CASE("MatchPipeline with no unstructured items returns nothing", "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const auto catalog = extraction::build_catalog_items(kCatalog, extractor);

  const similarity::TfidfSimilarityEngine engine;
  CHECK(matching::MatchPipeline(engine).run(catalog, {}).empty());
}

TEST_CASE("MatchPipeline parallel scoring equals serial scoring", "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const auto catalog = extraction::build_catalog_items(kCatalog, extractor);
  const auto unstructured = extraction::build_unstructured_items(make_batch(), extractor);

  const similarity::TfidfSimilarityEngine engine;
  const auto serial = matching::MatchPipeline(engine).run(catalog, unstructured);

  for (const std::size_t threads : {2U, 4U, 64U}) {
    matching::PipelineOptions options;
    options.worker_threads = threads;
    const auto parallel =
        matching::MatchPipeline(engine, matching::MatcherConfig{}, options).run(catalog,
                                                                                unstructured);
    require_same_results(serial, parallel);
  }
}

TEST_CASE("MatchPipeline with far more workers than items equals serial scoring",
          "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const auto catalog = extraction::build_catalog_items(kCatalog, extractor);
  const auto unstructured = extraction::build_unstructured_items(
      {{std::nullopt, "black nike shoes"},
       {std::nullopt, "red zara dress"},
       {std::nullopt, "gucci belt"}},
      extractor);

  const similarity::TfidfSimilarityEngine engine;
  const auto serial = matching::MatchPipeline(engine).run(catalog, unstructured);

  matching::PipelineOptions options;
  options.worker_threads = 4000;
  const auto parallel =
      matching::MatchPipeline(engine, matching::MatcherConfig{}, options).run(catalog,
                                                                              unstructured);
  require_same_results(serial, parallel);
}

TEST_CASE("effective_worker_count clamps to items and hardware", "[pipeline]") {
  CHECK(matching::effective_worker_count(0, 10, 8) == 1);
  CHECK(matching::effective_worker_count(1, 10, 8) == 1);
  CHECK(matching::effective_worker_count(4, 10, 8) == 4);
  CHECK(matching::effective_worker_count(4000, 4000, 8) == 8);
  CHECK(matching::effective_worker_count(4000, 3, 8) == 3);
  CHECK(matching::effective_worker_count(4000, 0, 8) == 1);
  // Unknown hardware concurrency leaves only the item cap
  CHECK(matching::effective_worker_count(16, 100, 0) == 16);
}

TEST_CASE("MatchPipeline is deterministic across runs", "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const auto catalog = extraction::build_catalog_items(kCatalog, extractor);
  const auto unstructured = extraction::build_unstructured_items(make_batch(), extractor);

  const similarity::TfidfSimilarityEngine engine;
  const matching::MatchPipeline pipeline(engine);
  require_same_results(pipeline.run(catalog, unstructured), pipeline.run(catalog, unstructured));
}

TEST_CASE("MatchPipeline rejects duplicate ids", "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const similarity::TfidfSimilarityEngine engine;
  const matching::MatchPipeline pipeline(engine);

  SECTION("duplicate catalog id") {
    const auto catalog = extraction::build_catalog_items(
        {{core::CatalogId{"P-1"}, "red shoe"}, {core::CatalogId{"P-1"}, "blue shoe"}}, extractor);
    const auto unstructured = extraction::build_unstructured_items({{std::nullopt, "shoe"}},
                                                                   extractor);
    CHECK_THROWS_AS(pipeline.run(catalog, unstructured), std::invalid_argument);
  }

  SECTION("duplicate unstructured id") {
    const auto catalog =
        extraction::build_catalog_items({{core::CatalogId{"P-1"}, "red shoe"}}, extractor);
    const auto unstructured = extraction::build_unstructured_items(
        {{std::string("u-1"), "shoe"}, {std::string("u-1"), "red"}}, extractor);
    CHECK_THROWS_AS(pipeline.run(catalog, unstructured), std::invalid_argument);
  }
}

TEST_CASE("MatchPipeline accepts CSV rows whose empty id meets an explicit positional id",
          "[pipeline][io]") {
  auto table = io::parse_csv("id,description\n,nike black shoe\n0,adidas white hoodie\n");
  REQUIRE(table.has_value());
  auto records = io::unstructured_records_from_table(table.value());
  REQUIRE(records.has_value());

  const extraction::AttributeExtractor extractor;
  const auto catalog = extraction::build_catalog_items(kCatalog, extractor);
  const auto unstructured = extraction::build_unstructured_items(records.value(), extractor);
  REQUIRE(unstructured.size() == 2);
  CHECK(unstructured[0].id.value == "0-1");
  CHECK(unstructured[1].id.value == "0");

  const similarity::TfidfSimilarityEngine engine;
  const auto results = matching::MatchPipeline(engine).run(catalog, unstructured);
  REQUIRE(results.size() == 2);
  CHECK(results[0].unstructured_id.value == "0-1");
  CHECK(results[0].matched_catalog_id->value == "P-100");
  CHECK(results[1].unstructured_id.value == "0");
  CHECK(results[1].matched_catalog_id->value == "P-101");
}

TEST_CASE("MatchPipeline rejects a matrix of the wrong shape", "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const auto catalog = extraction::build_catalog_items(kCatalog, extractor);
  const auto unstructured = extraction::build_unstructured_items(make_batch(), extractor);

  const FixedShapeEngine engine(unstructured.size(), catalog.size() - 1);
  const matching::MatchPipeline pipeline(engine);
  CHECK_THROWS_AS(pipeline.run(catalog, unstructured), std::invalid_argument);

  const similarity::SimilarityMatrix wrong_rows(unstructured.size() + 1, catalog.size());
  CHECK_THROWS_AS(pipeline.run(catalog, unstructured, wrong_rows), std::invalid_argument);
}

TEST_CASE("MatchPipeline propagates vectorization failures", "[pipeline]") {
  const extraction::AttributeExtractor extractor;
  const auto catalog = extraction::build_catalog_items(
      {{core::CatalogId{"P-1"}, "the and"}, {core::CatalogId{"P-2"}, "of"}}, extractor);
  const auto unstructured = extraction::build_unstructured_items({{std::nullopt, "nike"}},
                                                                 extractor);

  const similarity::TfidfSimilarityEngine engine;
  CHECK_THROWS_AS(matching::MatchPipeline(engine).run(catalog, unstructured),
                  similarity::VectorizationError);
}

TEST_CASE("MatchPipeline rejects an invalid configuration", "[pipeline]") {
  const similarity::TfidfSimilarityEngine engine;

  matching::MatcherConfig config;
  config.top_k = 0;
  CHECK_THROWS_AS(matching::MatchPipeline(engine, config), std::invalid_argument);

  config = matching::MatcherConfig{};
  config.weights = {0.7, 0.7};
  CHECK_THROWS_AS(matching::MatchPipeline(engine, config), std::invalid_argument);
}
