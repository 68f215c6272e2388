#pragma once

#include "catmatch/core/ids.h"
#include "catmatch/domain/attribute_set.h"

#include <string>

namespace catmatch::domain {

// CatalogRecord is a catalog row as delivered by a loader (CSV, SQLite).
// A missing description arrives as the empty string.
struct CatalogRecord {
  core::CatalogId id;
  std::string description;
};

// CatalogItem is a catalog entry with its derived fields cached.
// normalized_description and attributes are computed once when the item is
// built and are read-only for the rest of the run.
struct CatalogItem {
  core::CatalogId id;
  std::string description;
  std::string normalized_description;
  AttributeSet attributes;
};

}  // namespace catmatch::domain
