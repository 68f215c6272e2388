#include "catmatch/io/record_loader.h"

#include "catmatch/core/normalization.h"

namespace catmatch::io {

namespace {

IoError missing_column(const std::string& name) {
  return IoError{"missing required column '" + name + "'"};
}

}  // namespace

CatalogLoadResult catalog_records_from_table(const CsvTable& table,
                                             const CatalogCsvColumns& columns) {
  const auto id_col = table.column_index(columns.id);
  if (!id_col.has_value()) {
    return CatalogLoadResult::err(missing_column(columns.id));
  }
  const auto desc_col = table.column_index(columns.description);
  if (!desc_col.has_value()) {
    return CatalogLoadResult::err(missing_column(columns.description));
  }

  std::vector<domain::CatalogRecord> records;
  records.reserve(table.rows.size());
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    std::string id = core::trim(row[*id_col]);
    if (id.empty()) {
      // Data row numbers are 1-based and exclude the header
      return CatalogLoadResult::err(
          IoError{"row " + std::to_string(r + 1) + ": empty '" + columns.id + "'"});
    }
    records.push_back({core::CatalogId{std::move(id)}, row[*desc_col]});
  }

  return CatalogLoadResult::ok(std::move(records));
}

UnstructuredLoadResult unstructured_records_from_table(const CsvTable& table,
                                                       const UnstructuredCsvColumns& columns) {
  const auto desc_col = table.column_index(columns.description);
  if (!desc_col.has_value()) {
    return UnstructuredLoadResult::err(missing_column(columns.description));
  }
  const auto id_col = table.column_index(columns.id);

  std::vector<domain::UnstructuredRecord> records;
  records.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    domain::UnstructuredRecord record;
    record.description = row[*desc_col];
    if (id_col.has_value()) {
      std::string id = core::trim(row[*id_col]);
      if (!id.empty()) {
        record.id = std::move(id);
      }
    }
    records.push_back(std::move(record));
  }

  return UnstructuredLoadResult::ok(std::move(records));
}

CatalogLoadResult load_catalog_csv(const std::string& path, const CatalogCsvColumns& columns) {
  auto table = read_csv_file(path);
  if (!table.has_value()) {
    return CatalogLoadResult::err(table.error());
  }
  auto records = catalog_records_from_table(table.value(), columns);
  if (!records.has_value()) {
    return CatalogLoadResult::err(IoError{path + ": " + records.error().message});
  }
  return records;
}

UnstructuredLoadResult load_unstructured_csv(const std::string& path,
                                             const UnstructuredCsvColumns& columns) {
  auto table = read_csv_file(path);
  if (!table.has_value()) {
    return UnstructuredLoadResult::err(table.error());
  }
  auto records = unstructured_records_from_table(table.value(), columns);
  if (!records.has_value()) {
    return UnstructuredLoadResult::err(IoError{path + ": " + records.error().message});
  }
  return records;
}

}  // namespace catmatch::io
