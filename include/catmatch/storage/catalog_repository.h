#pragma once

#include "catmatch/core/ids.h"
#include "catmatch/core/result.h"
#include "catmatch/domain/catalog_item.h"

#include <optional>
#include <string>
#include <vector>

namespace catmatch::storage {

// ICatalogRepository isolates where the canonical catalog lives.
// list_all() returns records ordered by id, which fixes the column order of
// the similarity matrix for a run.
class ICatalogRepository {
 public:
  virtual ~ICatalogRepository() = default;
  [[nodiscard]] virtual core::Result<bool, std::string> upsert(
      const domain::CatalogRecord& record) = 0;
  [[nodiscard]] virtual std::optional<domain::CatalogRecord> get(
      const core::CatalogId& id) const = 0;
  [[nodiscard]] virtual core::Result<std::vector<domain::CatalogRecord>, std::string> list_all()
      const = 0;
};

}  // namespace catmatch::storage
