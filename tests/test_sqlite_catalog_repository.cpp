#include "catmatch/storage/sqlite/sqlite_catalog_repository.h"
#include "catmatch/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

using namespace catmatch;

// Helper: open an in-memory DB with schema v1 applied.
static std::shared_ptr<storage::sqlite::SqliteDb> make_db() {
  auto result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  auto schema = db->ensure_schema_v1();
  REQUIRE(schema.has_value());
  return db;
}

TEST_CASE("SqliteDb applies schema v1 once", "[sqlite]") {
  auto db = make_db();
  CHECK(db->get_schema_version() == 1);
  CHECK(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteCatalogRepository roundtrip", "[sqlite][repository]") {
  auto db = make_db();
  storage::sqlite::SqliteCatalogRepository repo(db);

  REQUIRE(repo.upsert({core::CatalogId{"P-1"}, "Levi's 32\" Jeans, Blue"}).has_value());

  auto retrieved = repo.get(core::CatalogId{"P-1"});
  REQUIRE(retrieved.has_value());
  CHECK(retrieved->id.value == "P-1");
  CHECK(retrieved->description == "Levi's 32\" Jeans, Blue");

  CHECK_FALSE(repo.get(core::CatalogId{"missing"}).has_value());
}

TEST_CASE("SqliteCatalogRepository upsert replaces descriptions", "[sqlite][repository]") {
  auto db = make_db();
  storage::sqlite::SqliteCatalogRepository repo(db);

  REQUIRE(repo.upsert({core::CatalogId{"P-1"}, "old"}).has_value());
  REQUIRE(repo.upsert({core::CatalogId{"P-1"}, "new"}).has_value());

  auto all = repo.list_all();
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 1);
  CHECK(all.value()[0].description == "new");
}

TEST_CASE("SqliteCatalogRepository lists records by id", "[sqlite][repository]") {
  auto db = make_db();
  storage::sqlite::SqliteCatalogRepository repo(db);

  auto written = repo.upsert_all({
      {core::CatalogId{"P-3"}, "three"},
      {core::CatalogId{"P-1"}, "one"},
      {core::CatalogId{"P-2"}, ""},
  });
  REQUIRE(written.has_value());
  CHECK(written.value() == 3);

  auto all = repo.list_all();
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 3);
  CHECK(all.value()[0].id.value == "P-1");
  CHECK(all.value()[1].id.value == "P-2");
  CHECK(all.value()[1].description.empty());
  CHECK(all.value()[2].id.value == "P-3");
}

TEST_CASE("SqliteCatalogRepository upsert_all is all or nothing", "[sqlite][repository]") {
  auto db = make_db();
  storage::sqlite::SqliteCatalogRepository repo(db);

  auto written = repo.upsert_all({
      {core::CatalogId{"P-1"}, "one"},
      {core::CatalogId{""}, "no id"},
  });
  REQUIRE_FALSE(written.has_value());

  auto all = repo.list_all();
  REQUIRE(all.has_value());
  CHECK(all.value().empty());
}

TEST_CASE("SqliteCatalogRepository rejects empty ids", "[sqlite][repository]") {
  auto db = make_db();
  storage::sqlite::SqliteCatalogRepository repo(db);
  CHECK_FALSE(repo.upsert({core::CatalogId{""}, "x"}).has_value());
}
