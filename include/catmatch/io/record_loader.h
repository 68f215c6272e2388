#pragma once

#include "catmatch/core/result.h"
#include "catmatch/domain/catalog_item.h"
#include "catmatch/domain/unstructured_item.h"
#include "catmatch/io/csv.h"

#include <string>
#include <vector>

namespace catmatch::io {

struct CatalogCsvColumns {
  std::string id{"Product_ID"};
  std::string description{"Description"};
};

struct UnstructuredCsvColumns {
  std::string id{"id"};  // Optional; rows fall back to their position
  std::string description{"description"};
};

using CatalogLoadResult = core::Result<std::vector<domain::CatalogRecord>, IoError>;
using UnstructuredLoadResult = core::Result<std::vector<domain::UnstructuredRecord>, IoError>;

// Catalog rows require a non-empty id. A missing column is an error.
[[nodiscard]] CatalogLoadResult catalog_records_from_table(const CsvTable& table,
                                                           const CatalogCsvColumns& columns = {});

// Unstructured rows only require the description column. An empty id cell
// leaves the record without an id.
[[nodiscard]] UnstructuredLoadResult unstructured_records_from_table(
    const CsvTable& table, const UnstructuredCsvColumns& columns = {});

[[nodiscard]] CatalogLoadResult load_catalog_csv(const std::string& path,
                                                 const CatalogCsvColumns& columns = {});

[[nodiscard]] UnstructuredLoadResult load_unstructured_csv(
    const std::string& path, const UnstructuredCsvColumns& columns = {});

}  // namespace catmatch::io
