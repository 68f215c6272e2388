#include "catmatch/extraction/attribute_extractor.h"

#include "catmatch/core/normalization.h"

#include <stdexcept>

namespace catmatch::extraction {

namespace {

std::regex compile_pattern(const domain::AttributeKind kind, const std::string& pattern) {
  std::regex compiled;
  try {
    compiled = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error& e) {
    throw std::invalid_argument("invalid " + std::string(domain::attribute_label(kind)) +
                                " pattern '" + pattern + "': " + e.what());
  }
  if (compiled.mark_count() < 1) {
    throw std::invalid_argument(std::string(domain::attribute_label(kind)) +
                                " pattern must have a capture group: " + pattern);
  }
  return compiled;
}

}  // namespace

const std::string& AttributePatterns::pattern_for(const domain::AttributeKind kind) const {
  switch (kind) {
    case domain::AttributeKind::kBrand:
      return brand;
    case domain::AttributeKind::kColor:
      return color;
    case domain::AttributeKind::kSize:
      return size;
    case domain::AttributeKind::kSeason:
      return season;
    case domain::AttributeKind::kGender:
      return gender;
  }
  throw std::invalid_argument("unknown attribute kind");
}

AttributePatterns default_attribute_patterns() {
  return AttributePatterns{
      .brand = R"(\b(nike|adidas|puma|vans|converse|levi s|zara|h m|gucci|prada)\b)",
      .color = R"(\b(black|white|blue|red|green|yellow|navy|grey|pink|beige|brown)\b)",
      .size = R"(\b(xs|s|m|l|xl|xxl|\d{1,2}(?:\s?(?:cm|mm|in))?)\b)",
      .season = R"(\b(summer|winter|autumn|spring|fall|ss\d{2}|fw\d{2})\b)",
      .gender = R"(\b(men|women|kids|unisex|boy|girl)\b)",
  };
}

AttributeExtractor::AttributeExtractor(AttributePatterns patterns)
    : patterns_(std::move(patterns)),
      matchers_{{
          {domain::AttributeKind::kBrand,
           compile_pattern(domain::AttributeKind::kBrand, patterns_.brand)},
          {domain::AttributeKind::kColor,
           compile_pattern(domain::AttributeKind::kColor, patterns_.color)},
          {domain::AttributeKind::kSize,
           compile_pattern(domain::AttributeKind::kSize, patterns_.size)},
          {domain::AttributeKind::kSeason,
           compile_pattern(domain::AttributeKind::kSeason, patterns_.season)},
          {domain::AttributeKind::kGender,
           compile_pattern(domain::AttributeKind::kGender, patterns_.gender)},
      }} {}

domain::AttributeSet AttributeExtractor::extract(const std::string_view text) const {
  return extract_normalized(core::normalize_description(text));
}

domain::AttributeSet AttributeExtractor::extract_normalized(const std::string& normalized) const {
  domain::AttributeSet attributes;
  for (const auto kind : domain::kAllAttributeKinds) {
    auto value = match_kind(kind, normalized);
    if (value.has_value()) {
      attributes.set(kind, std::move(*value));
    }
  }
  return attributes;
}

std::optional<std::string> AttributeExtractor::match_kind(const domain::AttributeKind kind,
                                                          const std::string& normalized) const {
  const auto& matcher = matchers_[static_cast<std::size_t>(kind)];

  std::smatch match;
  if (!std::regex_search(normalized, match, matcher.pattern)) {
    return std::nullopt;
  }
  // An optional group that did not participate counts as no value
  if (!match[1].matched || match[1].length() == 0) {
    return std::nullopt;
  }
  return match[1].str();
}

}  // namespace catmatch::extraction
