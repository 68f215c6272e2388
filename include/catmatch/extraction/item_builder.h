#pragma once

#include "catmatch/domain/catalog_item.h"
#include "catmatch/domain/unstructured_item.h"
#include "catmatch/extraction/attribute_extractor.h"

#include <vector>

namespace catmatch::extraction {

// build_catalog_items normalizes each description and extracts its
// attributes once. Input order is preserved; it becomes the column order of
// the similarity matrix.
[[nodiscard]] std::vector<domain::CatalogItem> build_catalog_items(
    const std::vector<domain::CatalogRecord>& records, const AttributeExtractor& extractor);

// build_unstructured_items does the same for free-text records. A record
// without an id gets its zero-based position as id; if an explicit id in the
// batch already uses that text, "-1", "-2", ... is appended until it is free.
// Explicit ids are kept as given.
[[nodiscard]] std::vector<domain::UnstructuredItem> build_unstructured_items(
    const std::vector<domain::UnstructuredRecord>& records, const AttributeExtractor& extractor);

}  // namespace catmatch::extraction
