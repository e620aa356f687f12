#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/trip_query.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/graph_writer.hpp"
#include "internal/ingest/record_normalizer.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/trip_fixtures.hpp"

#if TRIPGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using tripgraph::core::TripQuery;

std::shared_ptr<tripgraph::db::GraphRepository> SeededRepository() {
  auto repo = std::make_shared<tripgraph::db::memory::MemoryRepository>();
  tripgraph::ingest::GraphWriter writer(repo);
  writer.Write(tripgraph::ingest::Normalize(tripgraph::testing::NewYorkToChicago()));
  writer.Write(tripgraph::ingest::Normalize(tripgraph::testing::MakeRecord("New York", "Boston", 2, "[]", "[]")));
  writer.Write(tripgraph::ingest::Normalize(tripgraph::testing::MakeRecord("Seattle", "Chicago", 4, "[]", "[]")));
  return repo;
}

void TestLookupIsCaseInsensitive() {
  TripQuery query(SeededRepository());

  const auto exact  = query.LookupByOriginDestination("New York", "Chicago");
  const auto folded = query.LookupByOriginDestination("new york", "CHICAGO");
  assert(exact.size() == 1);
  assert(folded.size() == 1);
  assert(folded[0].id == exact[0].id);
  assert(folded[0].org == "New York");
  assert(folded[0].days == 3);
  assert(folded[0].annotated_plan.find("Millennium Park") != std::string::npos);
}

void TestLookupByOriginKeepsIngestionOrder() {
  TripQuery query(SeededRepository());

  const auto trips = query.LookupByOrigin("NEW YORK");
  assert(trips.size() == 2);
  assert(trips[0].dest == "Chicago");
  assert(trips[1].dest == "Boston");
  assert(trips[0].id < trips[1].id);

  assert(query.LookupByOrigin("Atlantis").empty());
  assert(query.LookupByOriginDestination("Seattle", "Boston").empty());
  // no substring or whitespace folding
  assert(query.LookupByOrigin("New").empty());
  assert(query.LookupByOrigin(" New York").empty());
}

void TestSearchBroadensToOrigin() {
  TripQuery query(SeededRepository());

  auto narrow = query.Search("seattle", std::string("chicago"));
  assert(!narrow.broadened);
  assert(narrow.trips.size() == 1);

  auto broad = query.Search("New York", std::string("Denver"));
  assert(broad.broadened);
  assert(broad.trips.size() == 2);

  auto origin_only = query.Search("New York", std::nullopt);
  assert(!origin_only.broadened);
  assert(origin_only.trips.size() == 2);

  auto blank_destination = query.Search("New York", std::string("  "));
  assert(!blank_destination.broadened);
  assert(blank_destination.trips.size() == 2);

  auto nothing = query.Search("Atlantis", std::string("Chicago"));
  assert(nothing.broadened);
  assert(nothing.trips.empty());
}

void TestSearchRequiresOrigin() {
  TripQuery query(SeededRepository());
  for (const std::string origin : {"", "   "}) {
    bool thrown = false;
    try {
      query.Search(origin, std::string("Chicago"));
    } catch (const tripgraph::util::InvalidArgument&) {
      thrown = true;
    }
    assert(thrown);
  }
}

void TestStatsCoverEveryLabelAndType() {
  TripQuery query(SeededRepository());

  const auto stats = query.Stats();
  assert(stats.nodes.size() == 8);
  assert(stats.relationships.size() == 9);
  // New York, Chicago, Boston, Seattle
  assert(stats.nodes.at("City") == 4);
  assert(stats.nodes.at("TripPlan") == 3);
  assert(stats.nodes.at("DayPlan") == 2);
  assert(stats.nodes.at("Meal") == 1);
  assert(stats.nodes.at("Attraction") == 1);
  assert(stats.nodes.at("Transportation") == 0);
  assert(stats.nodes.at("ReferenceInfo") == 1);
  assert(stats.relationships.at("ORIGIN") == 3);
  assert(stats.relationships.at("DESTINATION") == 3);
  assert(stats.relationships.at("IN_CITY") == 2);
  assert(stats.relationships.at("HAS_REFERENCE") == 1);
}

void TestEmptyGraph() {
  TripQuery query(std::make_shared<tripgraph::db::memory::MemoryRepository>());
  assert(query.LookupByOrigin("New York").empty());
  assert(query.Stats().nodes.at("City") == 0);
}

#if TRIPGRAPH_DB_SQLITE
// A store that fails mid-query must not look like an empty match, or Search would broaden.
void TestStoreFailureIsNotAnEmptyMatch() {
  auto db = std::make_shared<tripgraph::db::sqlite::SqliteDB>(":memory:");
  tripgraph::db::sqlite::BootstrapSchema(*db);
  auto repo = std::make_shared<tripgraph::db::sqlite::SqliteRepository>(db);
  tripgraph::ingest::GraphWriter(repo).Write(tripgraph::ingest::Normalize(tripgraph::testing::NewYorkToChicago()));

  TripQuery query(repo);
  assert(query.Search("New York", "Boston").broadened);

  db->Exec("DROP TABLE trip_plan;");

  bool thrown = false;
  try {
    query.Search("New York", "Boston");
  } catch (const tripgraph::util::SourceUnavailable& e) {
    thrown = true;
    assert(std::string(e.what()).find("FindTripPlans") != std::string::npos);
  }
  assert(thrown);

  db->Exec("DROP TABLE relationship;");
  thrown = false;
  try {
    query.Stats();
  } catch (const tripgraph::util::SourceUnavailable&) {
    thrown = true;
  }
  assert(thrown);
}
#endif

} // namespace

int main() {
  TestLookupIsCaseInsensitive();
  TestLookupByOriginKeepsIngestionOrder();
  TestSearchBroadensToOrigin();
  TestSearchRequiresOrigin();
  TestStatsCoverEveryLabelAndType();
  TestEmptyGraph();
#if TRIPGRAPH_DB_SQLITE
  TestStoreFailureIsNotAnEmptyMatch();
#endif

  std::cout << "tripgraph_unit_trip_query: pass\n";
  return 0;
}
