#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace catmatch::domain {

// AttributeKind is the closed set of categorical facets extracted from text.
// Enumeration order is the order in which attributes are compared and in
// which match reasons are reported.
enum class AttributeKind {
  kBrand,
  kColor,
  kSize,
  kSeason,
  kGender,
};

inline constexpr std::size_t kAttributeKindCount = 5;

inline constexpr std::array<AttributeKind, kAttributeKindCount> kAllAttributeKinds{
    AttributeKind::kBrand, AttributeKind::kColor, AttributeKind::kSize, AttributeKind::kSeason,
    AttributeKind::kGender,
};

// attribute_label is the capitalized kind name used in match reasons ("Brand").
std::string_view attribute_label(AttributeKind kind);

// AttributeSet holds at most one value per kind.
// It is a plain value: extraction builds it once and nothing mutates it afterwards.
class AttributeSet {
 public:
  AttributeSet() = default;

  void set(AttributeKind kind, std::string value) {
    values_[static_cast<std::size_t>(kind)] = std::move(value);
  }

  [[nodiscard]] const std::optional<std::string>& get(AttributeKind kind) const {
    return values_[static_cast<std::size_t>(kind)];
  }

  [[nodiscard]] bool has(AttributeKind kind) const { return get(kind).has_value(); }

  // Number of kinds that carry a value.
  [[nodiscard]] std::size_t size() const;

  bool operator==(const AttributeSet&) const = default;

 private:
  std::array<std::optional<std::string>, kAttributeKindCount> values_{};
};

}  // namespace catmatch::domain
