#pragma once

#include "catmatch/domain/attribute_set.h"

#include <array>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace catmatch::extraction {

// AttributePatterns is the immutable pattern configuration, one ECMAScript
// regex per attribute kind. Patterns run over normalized text (see
// core::normalize_description) and the first capture group of the first
// match is the attribute value.
struct AttributePatterns {
  std::string brand;
  std::string color;
  std::string size;
  std::string season;
  std::string gender;

  [[nodiscard]] const std::string& pattern_for(domain::AttributeKind kind) const;
};

// default_attribute_patterns returns the fixed catalog vocabulary.
// Brand spellings with punctuation ("levi's", "h&m") appear in their
// normalized form because punctuation is collapsed before matching.
AttributePatterns default_attribute_patterns();

// AttributeExtractor parses free text into an AttributeSet.
// Patterns are compiled once at construction; extract() is const and
// side-effect free, so one extractor can be shared across threads.
class AttributeExtractor {
 public:
  // Throws std::invalid_argument if any pattern fails to compile or has no
  // capture group.
  explicit AttributeExtractor(AttributePatterns patterns = default_attribute_patterns());

  // extract normalizes the text and then matches every kind.
  [[nodiscard]] domain::AttributeSet extract(std::string_view text) const;

  // extract_normalized skips normalization; the caller guarantees the text
  // is already the output of core::normalize_description.
  [[nodiscard]] domain::AttributeSet extract_normalized(const std::string& normalized) const;

  // match_kind returns the value for a single kind, or nullopt.
  [[nodiscard]] std::optional<std::string> match_kind(domain::AttributeKind kind,
                                                      const std::string& normalized) const;

  [[nodiscard]] const AttributePatterns& patterns() const { return patterns_; }

 private:
  struct KindMatcher {
    domain::AttributeKind kind;
    std::regex pattern;
  };

  AttributePatterns patterns_;
  std::array<KindMatcher, domain::kAttributeKindCount> matchers_;
};

}  // namespace catmatch::extraction
