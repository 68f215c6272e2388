#include "catmatch/matching/matcher_config.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <stdexcept>

namespace catmatch::matching {

core::Result<bool, std::string> MatcherConfig::validate() const {
  if (weights.text < 0.0 || weights.attribute < 0.0) {
    return core::Result<bool, std::string>::err("score weights must not be negative");
  }

  constexpr double kWeightSumTolerance = 1e-9;
  if (std::abs(weights.text + weights.attribute - 1.0) > kWeightSumTolerance) {
    return core::Result<bool, std::string>::err("score weights must sum to 1.0");
  }

  if (top_k == 0) {
    return core::Result<bool, std::string>::err("top_k must be at least 1");
  }

  if (high_text_similarity < 0.0 || high_text_similarity > 1.0) {
    return core::Result<bool, std::string>::err("high_text_similarity must be within [0, 1]");
  }

  return core::Result<bool, std::string>::ok(true);
}

std::string to_json(const MatcherConfig& config) {
  using json = nlohmann::json;

  // nlohmann::json objects are std::map backed, so keys come out sorted
  json j;
  j["high_text_similarity"] = config.high_text_similarity;
  j["top_k"] = config.top_k;
  j["weights"] = {
      {"attribute", config.weights.attribute},
      {"text", config.weights.text},
  };

  return j.dump();
}

MatcherConfig matcher_config_from_json(const std::string& json_str) {
  using json = nlohmann::json;

  json j;
  try {
    j = json::parse(json_str);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("invalid matcher config JSON: ") + e.what());
  }

  if (!j.is_object()) {
    throw std::runtime_error("matcher config must be a JSON object");
  }

  if (j.contains("top_k") && !j.at("top_k").is_number_unsigned()) {
    throw std::runtime_error("invalid matcher config value: top_k must be a non-negative integer");
  }

  MatcherConfig config;
  try {
    config.high_text_similarity = j.value("high_text_similarity", config.high_text_similarity);
    config.top_k = j.value("top_k", config.top_k);

    if (j.contains("weights")) {
      const auto& w = j.at("weights");
      config.weights.text = w.value("text", config.weights.text);
      config.weights.attribute = w.value("attribute", config.weights.attribute);
    }
  } catch (const json::type_error& e) {
    throw std::runtime_error(std::string("invalid matcher config value: ") + e.what());
  }

  return config;
}

}  // namespace catmatch::matching
