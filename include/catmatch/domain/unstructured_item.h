#pragma once

#include "catmatch/core/ids.h"
#include "catmatch/domain/attribute_set.h"

#include <optional>
#include <string>

namespace catmatch::domain {

// UnstructuredRecord is a free-text listing as delivered by a loader.
// id is absent when the source has no id column (or an empty id cell).
struct UnstructuredRecord {
  std::optional<std::string> id;
  std::string description;
};

// UnstructuredItem carries the resolved id (explicit id, or the zero-based
// position in the input sequence) and the cached derived fields.
struct UnstructuredItem {
  core::UnstructuredId id;
  std::string description;
  std::string normalized_description;
  AttributeSet attributes;
};

}  // namespace catmatch::domain
