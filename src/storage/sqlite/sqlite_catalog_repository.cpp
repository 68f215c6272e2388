#include "catmatch/storage/sqlite/sqlite_catalog_repository.h"

#include <sqlite3.h>

namespace catmatch::storage::sqlite {

namespace {

constexpr const char* kUpsertSql = R"(
  INSERT INTO products (product_id, description)
  VALUES (?, ?)
  ON CONFLICT(product_id) DO UPDATE SET
    description = excluded.description
)";

std::string column_text(sqlite3_stmt* stmt, int column) {
  const auto* text = sqlite3_column_text(stmt, column);
  return text != nullptr ? reinterpret_cast<const char*>(text) : std::string{};
}

core::Result<bool, std::string> bind_and_step(sqlite3* db, PreparedStatement& stmt,
                                              const domain::CatalogRecord& record) {
  sqlite3_bind_text(stmt.get(), 1, record.id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, record.description.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt.get());
  stmt.reset();
  if (rc != SQLITE_DONE) {
    return core::Result<bool, std::string>::err("Failed to upsert product " + record.id.value +
                                                ": " + sqlite3_errmsg(db));
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace

SqliteCatalogRepository::SqliteCatalogRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteCatalogRepository::upsert(
    const domain::CatalogRecord& record) {
  if (record.id.value.empty()) {
    return core::Result<bool, std::string>::err("catalog id must not be empty");
  }

  PreparedStatement stmt(db_->connection(), kUpsertSql);
  if (!stmt.is_valid()) {
    return core::Result<bool, std::string>::err("Failed to prepare upsert: " + stmt.error());
  }
  return bind_and_step(db_->connection(), stmt, record);
}

core::Result<std::size_t, std::string> SqliteCatalogRepository::upsert_all(
    const std::vector<domain::CatalogRecord>& records) {
  auto begin = db_->exec("BEGIN TRANSACTION");
  if (!begin.has_value()) {
    return core::Result<std::size_t, std::string>::err(begin.error());
  }

  const auto rollback_with = [this](const std::string& error) {
    // A failed rollback is ignored; the caller gets the first error
    [[maybe_unused]] const auto rolled_back = db_->exec("ROLLBACK");
    return core::Result<std::size_t, std::string>::err(error);
  };

  PreparedStatement stmt(db_->connection(), kUpsertSql);
  if (!stmt.is_valid()) {
    return rollback_with("Failed to prepare upsert: " + stmt.error());
  }

  for (const auto& record : records) {
    if (record.id.value.empty()) {
      return rollback_with("catalog id must not be empty");
    }
    auto step = bind_and_step(db_->connection(), stmt, record);
    if (!step.has_value()) {
      return rollback_with(step.error());
    }
  }

  auto commit = db_->exec("COMMIT");
  if (!commit.has_value()) {
    return rollback_with(commit.error());
  }
  return core::Result<std::size_t, std::string>::ok(records.size());
}

std::optional<domain::CatalogRecord> SqliteCatalogRepository::get(
    const core::CatalogId& id) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT product_id, description FROM products WHERE product_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return domain::CatalogRecord{core::CatalogId{column_text(stmt.get(), 0)},
                                 column_text(stmt.get(), 1)};
  }
  return std::nullopt;
}

core::Result<std::vector<domain::CatalogRecord>, std::string> SqliteCatalogRepository::list_all()
    const {
  using ListResult = core::Result<std::vector<domain::CatalogRecord>, std::string>;

  PreparedStatement stmt(db_->connection(),
                         "SELECT product_id, description FROM products ORDER BY product_id");
  if (!stmt.is_valid()) {
    return ListResult::err("Failed to list products: " + stmt.error());
  }

  std::vector<domain::CatalogRecord> records;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    records.push_back(domain::CatalogRecord{core::CatalogId{column_text(stmt.get(), 0)},
                                            column_text(stmt.get(), 1)});
  }

  if (rc != SQLITE_DONE) {
    return ListResult::err(std::string("Failed to list products: ") +
                           sqlite3_errmsg(db_->connection()));
  }
  return ListResult::ok(std::move(records));
}

}  // namespace catmatch::storage::sqlite
