#pragma once

#include <string>

namespace catmatch::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).
// These are "vocabulary types" that prevent confusing a catalog id with an
// unstructured record id at API boundaries.

struct CatalogId {
  std::string value;
  auto operator<=>(const CatalogId&) const = default;
};

struct UnstructuredId {
  std::string value;
  auto operator<=>(const UnstructuredId&) const = default;
};

}  // namespace catmatch::core
