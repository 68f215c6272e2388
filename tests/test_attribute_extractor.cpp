#include "catmatch/extraction/attribute_extractor.h"
#include "catmatch/extraction/item_builder.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace catmatch;
using domain::AttributeKind;

TEST_CASE("AttributeExtractor finds brand, color and gender", "[extraction]") {
  const extraction::AttributeExtractor extractor;
  const auto attrs = extractor.extract("Nike Black Running Shoes Men");

  CHECK(attrs.get(AttributeKind::kBrand) == "nike");
  CHECK(attrs.get(AttributeKind::kColor) == "black");
  CHECK(attrs.get(AttributeKind::kGender) == "men");
  CHECK_FALSE(attrs.has(AttributeKind::kSize));
  CHECK_FALSE(attrs.has(AttributeKind::kSeason));
  CHECK(attrs.size() == 3);
}

TEST_CASE("AttributeExtractor finds every kind", "[extraction]") {
  const extraction::AttributeExtractor extractor;
  const auto attrs = extractor.extract("Adidas Red Hoodie XL Winter Unisex");

  CHECK(attrs.get(AttributeKind::kBrand) == "adidas");
  CHECK(attrs.get(AttributeKind::kColor) == "red");
  CHECK(attrs.get(AttributeKind::kSize) == "xl");
  CHECK(attrs.get(AttributeKind::kSeason) == "winter");
  CHECK(attrs.get(AttributeKind::kGender) == "unisex");
}

TEST_CASE("AttributeExtractor size includes units", "[extraction]") {
  const extraction::AttributeExtractor extractor;

  CHECK(extractor.extract("Zara Dress 38 cm Summer Women").get(AttributeKind::kSize) == "38 cm");
  CHECK(extractor.extract("Puma Cap 12mm").get(AttributeKind::kSize) == "12mm");
  CHECK(extractor.extract("Vans Slip On 42").get(AttributeKind::kSize) == "42");
}

TEST_CASE("AttributeExtractor season codes", "[extraction]") {
  const extraction::AttributeExtractor extractor;

  CHECK(extractor.extract("Gucci Bag SS24").get(AttributeKind::kSeason) == "ss24");
  CHECK(extractor.extract("Prada Coat FW23 collection").get(AttributeKind::kSeason) == "fw23");
}

TEST_CASE("AttributeExtractor matches punctuated brands in normalized form", "[extraction]") {
  const extraction::AttributeExtractor extractor;

  CHECK(extractor.extract("H&M Basic Tee").get(AttributeKind::kBrand) == "h m");
  CHECK(extractor.extract("LEVI'S Trucker Jacket").get(AttributeKind::kBrand) == "levi s");
  CHECK(extractor.extract("Levi\xE2\x80\x99s Trucker Jacket").get(AttributeKind::kBrand) ==
        "levi s");
}

TEST_CASE("AttributeExtractor keeps the first match in text order", "[extraction]") {
  const extraction::AttributeExtractor extractor;
  CHECK(extractor.extract("black and white sneakers").get(AttributeKind::kColor) == "black");
  CHECK(extractor.extract("white and black sneakers").get(AttributeKind::kColor) == "white");
}

TEST_CASE("AttributeExtractor respects word boundaries", "[extraction]") {
  const extraction::AttributeExtractor extractor;

  CHECK(extractor.extract("Womens parka").get(AttributeKind::kGender) == std::nullopt);
  CHECK(extractor.extract("parka for women").get(AttributeKind::kGender) == "women");
  CHECK_FALSE(extractor.extract("redwood table").has(AttributeKind::kColor));
}

TEST_CASE("AttributeExtractor applies typo corrections before matching", "[extraction]") {
  const extraction::AttributeExtractor extractor;
  CHECK(extractor.extract("Naavy santals").get(AttributeKind::kColor) == "navy");
}

TEST_CASE("AttributeExtractor returns an empty set for empty text", "[extraction]") {
  const extraction::AttributeExtractor extractor;
  CHECK(extractor.extract("").size() == 0);
  CHECK(extractor.extract("!!!").size() == 0);
}

TEST_CASE("AttributeExtractor rejects unusable patterns", "[extraction]") {
  SECTION("pattern that does not compile") {
    auto patterns = extraction::default_attribute_patterns();
    patterns.color = "(black";
    CHECK_THROWS_AS(extraction::AttributeExtractor(patterns), std::invalid_argument);
  }

  SECTION("pattern without a capture group") {
    auto patterns = extraction::default_attribute_patterns();
    patterns.brand = "nike";
    CHECK_THROWS_AS(extraction::AttributeExtractor(patterns), std::invalid_argument);
  }
}

TEST_CASE("AttributeExtractor accepts custom patterns", "[extraction]") {
  auto patterns = extraction::default_attribute_patterns();
  patterns.brand = R"(\b(acme|globex)\b)";
  const extraction::AttributeExtractor extractor(patterns);

  CHECK(extractor.extract("Globex rain jacket").get(AttributeKind::kBrand) == "globex");
  CHECK_FALSE(extractor.extract("Nike rain jacket").has(AttributeKind::kBrand));
}

TEST_CASE("build_unstructured_items assigns positional ids", "[extraction]") {
  const extraction::AttributeExtractor extractor;
  const std::vector<domain::UnstructuredRecord> records{
      {std::nullopt, "Nike shoe"},
      {std::string("u-7"), "Adidas shirt"},
      {std::nullopt, "Puma cap"},
  };

  const auto items = extraction::build_unstructured_items(records, extractor);
  REQUIRE(items.size() == 3);
  CHECK(items[0].id.value == "0");
  CHECK(items[1].id.value == "u-7");
  CHECK(items[2].id.value == "2");
  CHECK(items[1].normalized_description == "adidas shirt");
  CHECK(items[2].attributes.get(AttributeKind::kBrand) == "puma");
}

TEST_CASE("build_unstructured_items keeps positional ids clear of explicit ids",
          "[extraction]") {
  const extraction::AttributeExtractor extractor;
  const std::vector<domain::UnstructuredRecord> records{
      {std::nullopt, "Nike shoe"},
      {std::string("0"), "Adidas shirt"},
      {std::string("2-1"), "Puma cap"},
      {std::string("0-1"), "Zara dress"},
      {std::nullopt, "Gucci belt"},
  };

  const auto items = extraction::build_unstructured_items(records, extractor);
  REQUIRE(items.size() == 5);
  CHECK(items[0].id.value == "0-2");
  CHECK(items[1].id.value == "0");
  CHECK(items[2].id.value == "2-1");
  CHECK(items[3].id.value == "0-1");
  CHECK(items[4].id.value == "4");
}

TEST_CASE("build_catalog_items caches normalized text and attributes", "[extraction]") {
  const extraction::AttributeExtractor extractor;
  const std::vector<domain::CatalogRecord> records{
      {core::CatalogId{"P-2"}, "Converse Grey Sneakers Kids"},
      {core::CatalogId{"P-1"}, ""},
  };

  const auto items = extraction::build_catalog_items(records, extractor);
  REQUIRE(items.size() == 2);
  CHECK(items[0].id.value == "P-2");
  CHECK(items[0].normalized_description == "converse grey sneakers kids");
  CHECK(items[0].attributes.get(AttributeKind::kGender) == "kids");
  CHECK(items[1].normalized_description.empty());
  CHECK(items[1].attributes.size() == 0);
}
