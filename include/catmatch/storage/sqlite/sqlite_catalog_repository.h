#pragma once

#include "catmatch/storage/catalog_repository.h"
#include "catmatch/storage/sqlite/sqlite_db.h"

#include <memory>

namespace catmatch::storage::sqlite {

// SqliteCatalogRepository implements ICatalogRepository over the products
// table (schema v1). Records are listed in product_id order.
class SqliteCatalogRepository final : public ICatalogRepository {
 public:
  explicit SqliteCatalogRepository(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> upsert(
      const domain::CatalogRecord& record) override;
  [[nodiscard]] std::optional<domain::CatalogRecord> get(const core::CatalogId& id) const override;
  [[nodiscard]] core::Result<std::vector<domain::CatalogRecord>, std::string> list_all()
      const override;

  // upsert_all writes every record inside one transaction; on failure the
  // transaction is rolled back and nothing is written.
  [[nodiscard]] core::Result<std::size_t, std::string> upsert_all(
      const std::vector<domain::CatalogRecord>& records);

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace catmatch::storage::sqlite
