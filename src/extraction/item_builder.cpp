#include "catmatch/extraction/item_builder.h"

#include "catmatch/core/normalization.h"

#include <set>
#include <string>

namespace catmatch::extraction {

namespace {

// "<index>", or "<index>-<n>" with the smallest n >= 1 not yet taken.
std::string positional_id(const std::size_t index, std::set<std::string>& taken) {
  const std::string base = std::to_string(index);
  std::string candidate = base;
  for (std::size_t n = 1; taken.contains(candidate); ++n) {
    candidate = base + "-" + std::to_string(n);
  }
  taken.insert(candidate);
  return candidate;
}

}  // namespace

std::vector<domain::CatalogItem> build_catalog_items(
    const std::vector<domain::CatalogRecord>& records, const AttributeExtractor& extractor) {
  std::vector<domain::CatalogItem> items;
  items.reserve(records.size());

  for (const auto& record : records) {
    domain::CatalogItem item;
    item.id = record.id;
    item.description = record.description;
    item.normalized_description = core::normalize_description(record.description);
    item.attributes = extractor.extract_normalized(item.normalized_description);
    items.push_back(std::move(item));
  }

  return items;
}

std::vector<domain::UnstructuredItem> build_unstructured_items(
    const std::vector<domain::UnstructuredRecord>& records, const AttributeExtractor& extractor) {
  std::vector<domain::UnstructuredItem> items;
  items.reserve(records.size());

  // Positional ids must not collide with explicit ids anywhere in the batch
  std::set<std::string> taken;
  for (const auto& record : records) {
    if (record.id.has_value()) {
      taken.insert(record.id.value());
    }
  }

  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& record = records[i];

    domain::UnstructuredItem item;
    if (record.id.has_value()) {
      item.id.value = record.id.value();
    } else {
      item.id.value = positional_id(i, taken);
    }
    item.description = record.description;
    item.normalized_description = core::normalize_description(record.description);
    item.attributes = extractor.extract_normalized(item.normalized_description);
    items.push_back(std::move(item));
  }

  return items;
}

}  // namespace catmatch::extraction
