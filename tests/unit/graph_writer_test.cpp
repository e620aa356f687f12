#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/trip_query.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/graph_writer.hpp"
#include "internal/ingest/record_normalizer.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/hooked_repository.hpp"
#include "tests/support/trip_fixtures.hpp"

#if TRIPGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using tripgraph::db::GraphRepository;
using tripgraph::db::memory::MemoryRepository;
using tripgraph::graph::NodeLabel;
using tripgraph::graph::RelationshipType;
using tripgraph::ingest::GraphWriter;
using tripgraph::ingest::Normalize;

std::uint64_t Count(GraphRepository& repo, NodeLabel label) {
  auto       tx    = repo.BeginReadOnly();
  const auto count = repo.CountNodes(*tx, label);
  tx->Commit();
  return count;
}

std::uint64_t Count(GraphRepository& repo, RelationshipType type) {
  auto       tx    = repo.BeginReadOnly();
  const auto count = repo.CountRelationships(*tx, type);
  tx->Commit();
  return count;
}

void TestNewYorkToChicagoBuildsExpectedGraph() {
  auto        repo = std::make_shared<MemoryRepository>();
  GraphWriter writer(repo);

  const auto trip = Normalize(tripgraph::testing::NewYorkToChicago());
  assert(trip.issues.empty());
  const auto outcome = writer.Write(trip);
  assert(outcome.day_plans == 2);
  assert(outcome.activities == 2);
  assert(outcome.references == 1);

  assert(Count(*repo, NodeLabel::kCity) == 2);
  assert(Count(*repo, NodeLabel::kTripPlan) == 1);
  assert(Count(*repo, NodeLabel::kDayPlan) == 2);
  assert(Count(*repo, NodeLabel::kMeal) == 1);
  assert(Count(*repo, NodeLabel::kAttraction) == 1);
  assert(Count(*repo, NodeLabel::kTransportation) == 0);
  assert(Count(*repo, NodeLabel::kAccommodation) == 0);
  assert(Count(*repo, NodeLabel::kReferenceInfo) == 1);
  assert(Count(*repo, RelationshipType::kInCity) == 2);

  auto tx = repo->BeginReadOnly();

  const auto days = repo->Outgoing(*tx, outcome.trip_plan_id, RelationshipType::kHasDayPlan);
  assert(days.size() == 2);

  const auto day1 = repo->GetDayPlan(*tx, days[0]);
  assert(day1 && day1->day == 1 && day1->current_city == "New York");
  assert(repo->Outgoing(*tx, days[0], RelationshipType::kHasAttraction).empty());

  const auto meals = repo->Outgoing(*tx, days[0], RelationshipType::kHasMeal);
  assert(meals.size() == 1);
  const auto breakfast = repo->GetActivity(*tx, meals[0]);
  assert(breakfast && breakfast->value == "Hotel buffet");
  assert(breakfast->meal_slot == tripgraph::graph::MealSlot::kBreakfast);

  const auto attractions = repo->Outgoing(*tx, days[1], RelationshipType::kHasAttraction);
  assert(attractions.size() == 1);
  assert(repo->GetActivity(*tx, attractions[0])->value == "Millennium Park");

  const auto new_york = repo->FindCity(*tx, "New York");
  const auto chicago  = repo->FindCity(*tx, "Chicago");
  assert(new_york && chicago);
  assert(repo->Outgoing(*tx, outcome.trip_plan_id, RelationshipType::kOrigin) == std::vector<tripgraph::graph::NodeId>{new_york->id});
  assert(repo->Outgoing(*tx, outcome.trip_plan_id, RelationshipType::kDestination) == std::vector<tripgraph::graph::NodeId>{chicago->id});
  assert(repo->Outgoing(*tx, days[1], RelationshipType::kInCity) == std::vector<tripgraph::graph::NodeId>{chicago->id});

  const auto refs = repo->Outgoing(*tx, outcome.trip_plan_id, RelationshipType::kHasReference);
  assert(refs.size() == 1);
  const auto visa = repo->GetReference(*tx, refs[0]);
  assert(visa && visa->description == "Visa" && visa->content == "Not required");
  tx->Commit();

  tripgraph::core::TripQuery query(repo);
  const auto                 found = query.LookupByOriginDestination("New York", "Chicago");
  assert(found.size() == 1);
  assert(found[0].days == 3);
  assert(found[0].budget == 1900);
}

void TestCityMergeIsIdempotentAcrossRecords() {
  auto        repo = std::make_shared<MemoryRepository>();
  GraphWriter writer(repo);

  const auto trip = Normalize(tripgraph::testing::NewYorkToChicago());
  for (int i = 0; i < 3; ++i) {
    writer.Write(trip);
  }

  assert(Count(*repo, NodeLabel::kCity) == 2);
  assert(Count(*repo, NodeLabel::kTripPlan) == 3);
  assert(Count(*repo, RelationshipType::kOrigin) == 3);
}

using RepositoryMaker = std::function<std::shared_ptr<GraphRepository>()>;

std::shared_ptr<GraphRepository> MakeMemory() {
  return std::make_shared<MemoryRepository>();
}

#if TRIPGRAPH_DB_SQLITE
std::shared_ptr<GraphRepository> MakeSqlite() {
  auto db = std::make_shared<tripgraph::db::sqlite::SqliteDB>(":memory:");
  tripgraph::db::sqlite::BootstrapSchema(*db);
  return std::make_shared<tripgraph::db::sqlite::SqliteRepository>(std::move(db));
}
#endif

// Every step after the TripPlan insert, from the ORIGIN link to the last reference.
void TestFailedStepRollsBackWholeRecord(const RepositoryMaker& make_repository) {
  for (const std::string step : {"Relate:ORIGIN", "Relate:DESTINATION", "CreateDayPlan", "Relate:HAS_DAY_PLAN", "Relate:IN_CITY",
                                 "CreateActivity", "Relate:HAS_MEAL", "Relate:HAS_ATTRACTION", "CreateReference",
                                 "Relate:HAS_REFERENCE"}) {
    auto        inner  = make_repository();
    auto        hooked = std::make_shared<tripgraph::testing::HookedRepository>(inner);
    GraphWriter writer(hooked);
    hooked->FailOn(step, tripgraph::db::ErrorCode::ConstraintViolation);

    bool threw = false;
    try {
      writer.Write(Normalize(tripgraph::testing::NewYorkToChicago()));
    } catch (const tripgraph::util::WriteConflict& e) {
      threw = true;
      assert(e.Code() == tripgraph::db::ErrorCode::ConstraintViolation);
      assert(!e.Transient());
    }
    assert(threw);
    assert(hooked->Calls("CreateTripPlan") == 1);
    assert(hooked->Calls(step) == 1);

    for (const auto label : tripgraph::graph::kAllLabels) {
      assert(Count(*inner, label) == 0);
    }
    for (const auto type : tripgraph::graph::kAllRelationships) {
      assert(Count(*inner, type) == 0);
    }
    tripgraph::core::TripQuery query(inner);
    assert(query.LookupByOrigin("New York").empty());

    // the store is still usable after the rollback
    GraphWriter clean(inner);
    clean.Write(Normalize(tripgraph::testing::NewYorkToChicago()));
    assert(Count(*inner, NodeLabel::kTripPlan) == 1);
    assert(Count(*inner, NodeLabel::kCity) == 2);
  }
}

void TestPlaceholderActivitiesAreDropped() {
  auto        repo = std::make_shared<MemoryRepository>();
  GraphWriter writer(repo);

  const auto record = tripgraph::testing::MakeRecord(
      "Austin", "Denver", 1,
      "[{'days': 1, 'current_city': '-', 'transportation': '', 'breakfast': '-', 'lunch': ' ', "
      "'dinner': 'somewhere', 'attraction': '-', 'accommodation': '-'}]",
      "[]");
  const auto outcome = writer.Write(Normalize(record));
  assert(outcome.day_plans == 1);
  assert(outcome.activities == 1);

  assert(Count(*repo, NodeLabel::kMeal) == 1);
  assert(Count(*repo, NodeLabel::kTransportation) == 0);
  assert(Count(*repo, RelationshipType::kInCity) == 0);
  assert(Count(*repo, NodeLabel::kCity) == 2);

  auto       tx    = repo->BeginReadOnly();
  const auto days  = repo->Outgoing(*tx, outcome.trip_plan_id, RelationshipType::kHasDayPlan);
  const auto meals = repo->Outgoing(*tx, days.at(0), RelationshipType::kHasMeal);
  assert(meals.size() == 1);
  const auto dinner = repo->GetActivity(*tx, meals[0]);
  assert(dinner->value == "somewhere");
  assert(dinner->meal_slot == tripgraph::graph::MealSlot::kDinner);
  tx->Commit();
}

void TestMalformedPlanStillCreatesTripPlan() {
  auto        repo = std::make_shared<MemoryRepository>();
  GraphWriter writer(repo);

  const auto record  = tripgraph::testing::MakeRecord("Austin", "Denver", 2, "[{'days': 1, 'current_city': ", "not a literal");
  const auto trip    = Normalize(record);
  const auto outcome = writer.Write(trip);
  assert(trip.issues.size() == 2);
  assert(outcome.day_plans == 0);
  assert(outcome.references == 0);

  assert(Count(*repo, NodeLabel::kTripPlan) == 1);
  assert(Count(*repo, NodeLabel::kDayPlan) == 0);

  auto       tx   = repo->BeginReadOnly();
  const auto plan = repo->GetTripPlan(*tx, outcome.trip_plan_id);
  assert(plan && plan->annotated_plan == "[{'days': 1, 'current_city': ");
  tx->Commit();
}

} // namespace

int main() {
  TestNewYorkToChicagoBuildsExpectedGraph();
  TestCityMergeIsIdempotentAcrossRecords();
  TestFailedStepRollsBackWholeRecord(MakeMemory);
#if TRIPGRAPH_DB_SQLITE
  TestFailedStepRollsBackWholeRecord(MakeSqlite);
#endif
  TestPlaceholderActivitiesAreDropped();
  TestMalformedPlanStillCreatesTripPlan();

  std::cout << "tripgraph_unit_graph_writer: pass\n";
  return 0;
}
