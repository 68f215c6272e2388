#include "catmatch/storage/inmemory_catalog_repository.h"

namespace catmatch::storage {

core::Result<bool, std::string> InMemoryCatalogRepository::upsert(
    const domain::CatalogRecord& record) {
  if (record.id.value.empty()) {
    return core::Result<bool, std::string>::err("catalog id must not be empty");
  }
  records_[record.id] = record;
  return core::Result<bool, std::string>::ok(true);
}

std::optional<domain::CatalogRecord> InMemoryCatalogRepository::get(
    const core::CatalogId& id) const {
  auto it = records_.find(id);
  if (it != records_.end()) {
    return it->second;
  }
  return std::nullopt;
}

core::Result<std::vector<domain::CatalogRecord>, std::string> InMemoryCatalogRepository::list_all()
    const {
  std::vector<domain::CatalogRecord> result;
  result.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    result.push_back(record);
  }
  return core::Result<std::vector<domain::CatalogRecord>, std::string>::ok(std::move(result));
}

}  // namespace catmatch::storage
