#include "catmatch/io/csv.h"
#include "catmatch/io/result_writer.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace catmatch;

namespace {

std::vector<domain::MatchResult> sample_results() {
  domain::MatchResult matched;
  matched.unstructured_id = core::UnstructuredId{"0"};
  matched.original_description = "nike black running shoe, for men";
  matched.matched_catalog_id = core::CatalogId{"P-100"};
  matched.matched_description = "Nike Black Running Shoes Men";
  matched.confidence_score = 93.67;
  matched.match_reason = "Brand: nike | Color: black | Gender: men";
  matched.breakdown = {0.8944, 1.0, 0.9367};
  matched.candidates_considered = 5;

  domain::MatchResult unmatched;
  unmatched.unstructured_id = core::UnstructuredId{"1"};
  unmatched.original_description = "anything";

  return {matched, unmatched};
}

}  // namespace

TEST_CASE("format_confidence always prints two decimals", "[io]") {
  CHECK(io::format_confidence(93.67) == "93.67");
  CHECK(io::format_confidence(0.0) == "0.00");
  CHECK(io::format_confidence(100.0) == "100.00");
  CHECK(io::format_confidence(48.5) == "48.50");
}

TEST_CASE("format_results_csv writes the result columns", "[io]") {
  const auto csv = io::format_results_csv(sample_results());

  std::istringstream lines(csv);
  std::string header;
  std::getline(lines, header);
  CHECK(header ==
        "Unstructured_ID,Original_Description,Matched_Product_ID,Matched_Description,"
        "Confidence_Score,Match_Reason\r");

  CHECK(csv.find("0,\"nike black running shoe, for men\",P-100,Nike Black Running Shoes Men,"
                 "93.67,Brand: nike | Color: black | Gender: men\r\n") != std::string::npos);
  CHECK(csv.find("1,anything,,,0.00,Low Confidence Match\r\n") != std::string::npos);
}

TEST_CASE("results CSV reads back through the CSV parser", "[io]") {
  const auto results = sample_results();
  auto table = io::parse_csv(io::format_results_csv(results));
  REQUIRE(table.has_value());

  const auto& rows = table.value().rows;
  REQUIRE(rows.size() == results.size());
  CHECK(rows[0][1] == results[0].original_description);
  CHECK(rows[0][2] == "P-100");
  CHECK(rows[1][2].empty());
  CHECK(rows[1][5] == "Low Confidence Match");
}

TEST_CASE("results_to_json uses null for a missing match", "[io]") {
  const auto json = io::results_to_json(sample_results());

  REQUIRE(json.is_array());
  REQUIRE(json.size() == 2);
  CHECK(json[0]["Matched_Product_ID"] == "P-100");
  CHECK(json[0]["Confidence_Score"] == 93.67);
  CHECK(json[0]["candidates_considered"] == 5);
  CHECK(json[0]["breakdown"]["attribute"] == 1.0);
  CHECK(json[1]["Matched_Product_ID"].is_null());
  CHECK(json[1]["Matched_Description"].is_null());
  CHECK(json[1]["Match_Reason"] == "Low Confidence Match");
}

TEST_CASE("write_results_csv and write_results_json create files", "[io]") {
  const auto dir = std::filesystem::temp_directory_path();
  const auto csv_path = dir / "catmatch_test_results.csv";
  const auto json_path = dir / "catmatch_test_results.json";

  REQUIRE(io::write_results_csv(csv_path.string(), sample_results()).has_value());
  REQUIRE(io::write_results_json(json_path.string(), sample_results()).has_value());

  auto table = io::read_csv_file(csv_path.string());
  REQUIRE(table.has_value());
  CHECK(table.value().rows.size() == 2);

  std::ifstream json_file(json_path);
  const auto parsed = nlohmann::json::parse(json_file);
  CHECK(parsed.size() == 2);

  std::filesystem::remove(csv_path);
  std::filesystem::remove(json_path);
}

TEST_CASE("write_results_csv reports unwritable paths", "[io]") {
  auto result = io::write_results_csv("/nonexistent-dir/catmatch/results.csv", sample_results());
  REQUIRE_FALSE(result.has_value());
  CHECK_FALSE(result.error().message.empty());
}
