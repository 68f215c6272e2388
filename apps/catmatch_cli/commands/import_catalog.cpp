#include "import_catalog.h"

#include "catmatch/io/record_loader.h"
#include "catmatch/storage/sqlite/sqlite_catalog_repository.h"
#include "catmatch/storage/sqlite/sqlite_db.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ImportCliConfig {
  std::optional<std::string> db_path;
  catmatch::io::CatalogCsvColumns columns;
};

}  // namespace

int cmd_import_catalog(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<catmatch::apps::Option<ImportCliConfig>> options = {
      {"--db", true, "Path to SQLite catalog database (created if missing)",
       [](ImportCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--id-column", true, "Catalog id column (default Product_ID)",
       [](ImportCliConfig& c, const std::string& v) {
         c.columns.id = v;
         return true;
       }},
      {"--description-column", true, "Catalog description column (default Description)",
       [](ImportCliConfig& c, const std::string& v) {
         c.columns.description = v;
         return true;
       }},
  };

  std::vector<std::string> positional;
  auto parsed = catmatch::apps::parse_options(argc, argv, options, positional, 2);
  if (!parsed.has_value() || positional.size() != 1 || !parsed->db_path.has_value()) {
    std::cerr << "Usage: catmatch_cli import-catalog <csv> --db <db-path>\n";
    catmatch::apps::print_options(std::cerr, options);
    return 1;
  }
  const auto& config = parsed.value();
  const std::string& csv_path = positional.front();

  auto records = catmatch::io::load_catalog_csv(csv_path, config.columns);
  if (!records.has_value()) {
    std::cerr << "Failed to load catalog: " << records.error().message << "\n";
    return 1;
  }

  auto db_result = catmatch::storage::sqlite::SqliteDb::open(config.db_path.value());
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return 1;
  }

  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  catmatch::storage::sqlite::SqliteCatalogRepository repository(db);
  auto written = repository.upsert_all(records.value());
  if (!written.has_value()) {
    std::cerr << "Import failed: " << written.error() << "\n";
    return 1;
  }

  std::cout << "Imported " << written.value() << " catalog items from " << csv_path << " into "
            << config.db_path.value() << "\n";
  return 0;
}
