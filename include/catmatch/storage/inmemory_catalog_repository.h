#pragma once

#include "catmatch/storage/catalog_repository.h"

#include <map>

namespace catmatch::storage {

// InMemoryCatalogRepository stores records in a std::map, which gives the
// id-ordered iteration list_all() promises.
class InMemoryCatalogRepository final : public ICatalogRepository {
 public:
  [[nodiscard]] core::Result<bool, std::string> upsert(
      const domain::CatalogRecord& record) override;
  [[nodiscard]] std::optional<domain::CatalogRecord> get(const core::CatalogId& id) const override;
  [[nodiscard]] core::Result<std::vector<domain::CatalogRecord>, std::string> list_all()
      const override;

 private:
  std::map<core::CatalogId, domain::CatalogRecord> records_;
};

}  // namespace catmatch::storage
