#include "catmatch/io/result_writer.h"

#include <cstdio>
#include <fstream>

namespace catmatch::io {

namespace {

core::Result<bool, IoError> write_text_file(const std::string& path, const std::string& content) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return core::Result<bool, IoError>::err(IoError{"Could not open file for writing: " + path});
  }
  file << content;
  file.flush();
  if (!file) {
    return core::Result<bool, IoError>::err(IoError{"Failed to write file: " + path});
  }
  return core::Result<bool, IoError>::ok(true);
}

}  // namespace

std::string format_confidence(const double confidence_score) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f", confidence_score);
  return buffer;
}

std::string format_results_csv(const std::vector<domain::MatchResult>& results) {
  std::string out;

  bool first = true;
  for (const char* column : kResultColumns) {
    if (!first) {
      out.push_back(',');
    }
    out += column;
    first = false;
  }
  out += "\r\n";

  for (const auto& result : results) {
    out += escape_csv_field(result.unstructured_id.value);
    out.push_back(',');
    out += escape_csv_field(result.original_description);
    out.push_back(',');
    if (result.matched_catalog_id.has_value()) {
      out += escape_csv_field(result.matched_catalog_id->value);
    }
    out.push_back(',');
    if (result.matched_description.has_value()) {
      out += escape_csv_field(*result.matched_description);
    }
    out.push_back(',');
    out += format_confidence(result.confidence_score);
    out.push_back(',');
    out += escape_csv_field(result.match_reason);
    out += "\r\n";
  }

  return out;
}

core::Result<bool, IoError> write_results_csv(const std::string& path,
                                              const std::vector<domain::MatchResult>& results) {
  return write_text_file(path, format_results_csv(results));
}

nlohmann::json results_to_json(const std::vector<domain::MatchResult>& results) {
  nlohmann::json out = nlohmann::json::array();

  for (const auto& result : results) {
    nlohmann::json j;
    j["Unstructured_ID"] = result.unstructured_id.value;
    j["Original_Description"] = result.original_description;
    j["Matched_Product_ID"] = result.matched_catalog_id.has_value()
                                  ? nlohmann::json(result.matched_catalog_id->value)
                                  : nlohmann::json(nullptr);
    j["Matched_Description"] = result.matched_description.has_value()
                                   ? nlohmann::json(*result.matched_description)
                                   : nlohmann::json(nullptr);
    j["Confidence_Score"] = result.confidence_score;
    j["Match_Reason"] = result.match_reason;

    j["breakdown"] = {
        {"attribute", result.breakdown.attribute},
        {"fused", result.breakdown.fused},
        {"text", result.breakdown.text},
    };
    j["candidates_considered"] = result.candidates_considered;

    out.push_back(std::move(j));
  }

  return out;
}

core::Result<bool, IoError> write_results_json(const std::string& path,
                                               const std::vector<domain::MatchResult>& results) {
  return write_text_file(path, results_to_json(results).dump(2) + "\n");
}

}  // namespace catmatch::io
