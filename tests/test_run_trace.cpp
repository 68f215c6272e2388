#include "catmatch/app/run_trace.h"
#include "catmatch/core/ids.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <set>
#include <stdexcept>
#include <string>

using namespace catmatch;

TEST_CASE("strong ids compare by value", "[ids]") {
  CHECK(core::CatalogId{"P-1"} == core::CatalogId{"P-1"});
  CHECK(core::CatalogId{"P-1"} != core::CatalogId{"P-2"});
  CHECK(core::CatalogId{"P-1"} < core::CatalogId{"P-2"});
  CHECK(core::UnstructuredId{"10"} < core::UnstructuredId{"9"});

  const std::set<core::UnstructuredId> ids{{"b"}, {"a"}, {"b"}};
  REQUIRE(ids.size() == 2);
  CHECK(ids.begin()->value == "a");
}

TEST_CASE("RunTrace::fixed numbers events within its trace", "[run_trace]") {
  auto trace = app::RunTrace::fixed("run-7", "2026-01-01T00:00:00Z");
  CHECK(trace.trace_id() == "run-7");

  const auto first = trace.event("RunStarted", nlohmann::json{{"count", 2}}, {"a.csv"});
  const auto second = trace.event("RunCompleted", nlohmann::json{{"status", "success"}});

  CHECK(first.event_id == "run-7/evt-1");
  CHECK(first.trace_id == "run-7");
  CHECK(first.event_type == "RunStarted");
  CHECK(first.payload == R"({"count":2})");
  CHECK(first.created_at == "2026-01-01T00:00:00Z");
  CHECK(first.refs == std::vector<std::string>{"a.csv"});

  CHECK(second.event_id == "run-7/evt-2");
  CHECK(second.payload == R"({"status":"success"})");
  CHECK(second.refs.empty());
}

TEST_CASE("RunTrace reads the timestamp source per event", "[run_trace]") {
  int calls = 0;
  app::RunTrace trace("run-x", [&calls]() { return "t" + std::to_string(++calls); });

  CHECK(trace.event("A", nlohmann::json::object()).created_at == "t1");
  CHECK(trace.event("B", nlohmann::json::object()).created_at == "t2");
}

TEST_CASE("RunTrace rejects an empty trace id or timestamp source", "[run_trace]") {
  CHECK_THROWS_AS(app::RunTrace("", &app::utc_timestamp_now), std::invalid_argument);
  CHECK_THROWS_AS(app::RunTrace("run-1", app::RunTrace::TimestampSource{}),
                  std::invalid_argument);
}

TEST_CASE("RunTrace::from_wall_clock stamps ISO 8601 UTC times", "[run_trace]") {
  auto trace = app::RunTrace::from_wall_clock();
  CHECK(trace.trace_id().rfind("run-", 0) == 0);

  const auto event = trace.event("RunStarted", nlohmann::json::object());
  CHECK(event.event_id == trace.trace_id() + "/evt-1");
  // YYYY-MM-DDTHH:MM:SSZ
  REQUIRE(event.created_at.size() == 20);
  CHECK(event.created_at[4] == '-');
  CHECK(event.created_at[10] == 'T');
  CHECK(event.created_at.back() == 'Z');
}
