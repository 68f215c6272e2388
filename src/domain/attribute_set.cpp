#include "catmatch/domain/attribute_set.h"

#include <algorithm>

namespace catmatch::domain {

std::string_view attribute_label(const AttributeKind kind) {
  switch (kind) {
    case AttributeKind::kBrand:
      return "Brand";
    case AttributeKind::kColor:
      return "Color";
    case AttributeKind::kSize:
      return "Size";
    case AttributeKind::kSeason:
      return "Season";
    case AttributeKind::kGender:
      return "Gender";
  }
  return "Unknown";
}

std::size_t AttributeSet::size() const {
  return static_cast<std::size_t>(std::count_if(
      values_.begin(), values_.end(),
      [](const std::optional<std::string>& value) { return value.has_value(); }));
}

}  // namespace catmatch::domain
