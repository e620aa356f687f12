#include <cassert>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if TRIPGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if TRIPGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using tripgraph::db::ErrorCode;
using tripgraph::db::GraphRepository;
using tripgraph::db::TripPlanFilter;
using tripgraph::db::memory::MemoryRepository;
using tripgraph::db::model::ActivityRecord;
using tripgraph::db::model::CityRecord;
using tripgraph::db::model::DayPlanRecord;
using tripgraph::db::model::ReferenceRecord;
using tripgraph::db::model::TripPlanRecord;
using tripgraph::graph::ActivityKind;
using tripgraph::graph::MealSlot;
using tripgraph::graph::NodeId;
using tripgraph::graph::NodeLabel;
using tripgraph::graph::RelationshipType;

// Keeps names unique when a backend outlives one run (postgres).
std::string RunTag() {
  static const auto tag =
      std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
  return tag;
}

struct BackendFactory {
  std::string                                            name;
  std::function<std::shared_ptr<GraphRepository>()>      make_repository;
  std::function<bool()>                                  supports_restart;
  std::function<void(std::shared_ptr<GraphRepository>&)> restart;
  std::function<void()>                                  cleanup;
};

std::uint64_t Nodes(GraphRepository& repo, NodeLabel label) {
  auto tx    = repo.BeginReadOnly();
  auto count = repo.CountNodes(*tx, label);
  tx->Commit();
  return count;
}

std::uint64_t Relationships(GraphRepository& repo, RelationshipType type) {
  auto tx    = repo.BeginReadOnly();
  auto count = repo.CountRelationships(*tx, type);
  tx->Commit();
  return count;
}

NodeId Merge(GraphRepository& repo, tripgraph::db::Transaction& tx, const std::string& name) {
  CityRecord city{.name = name};
  assert(repo.MergeCity(tx, city));
  assert(city.id > 0);
  return city.id;
}

TripPlanRecord MakePlan(const std::string& org, const std::string& dest) {
  TripPlanRecord plan;
  plan.org                   = org;
  plan.dest                  = dest;
  plan.days                  = 3;
  plan.visiting_city_number  = 1;
  plan.date                  = "['2022-03-16', '2022-03-17', '2022-03-18']";
  plan.people_number         = 2;
  plan.local_constraint      = "{'house rule': None}";
  plan.budget                = 1234.5;
  plan.query                 = "Plan it.";
  plan.level                 = "medium";
  plan.annotated_plan        = "[{'days': 1, 'attraction': \"O'Hare\"}]";
  plan.reference_information = "[]";
  return plan;
}

void VerifyCityMergeIsIdempotent(GraphRepository& repo, const std::string& name) {
  const auto before = Nodes(repo, NodeLabel::kCity);

  auto tx    = repo.Begin();
  auto first = Merge(repo, *tx, name);
  assert(Merge(repo, *tx, name) == first);
  // names are case-sensitive
  auto other = Merge(repo, *tx, name + " lower");
  assert(other != first);
  tx->Commit();

  auto tx2 = repo.Begin();
  assert(Merge(repo, *tx2, name) == first);
  auto found = repo.FindCity(*tx2, name);
  assert(found.has_value());
  assert(found->id == first);
  assert(found->name == name);
  assert(!repo.FindCity(*tx2, name + " missing").has_value());
  tx2->Commit();

  assert(Nodes(repo, NodeLabel::kCity) == before + 2);
}

void VerifyTripPlanReadWrite(GraphRepository& repo, const std::string& org, const std::string& dest) {
  auto tx   = repo.Begin();
  auto plan = MakePlan(org, dest);
  assert(repo.CreateTripPlan(*tx, plan));
  assert(plan.id > 0);

  auto origin = Merge(repo, *tx, org);
  assert(repo.Relate(*tx, {.from_id = plan.id, .type = RelationshipType::kOrigin, .to_id = origin}));
  // relating twice is a no-op
  assert(repo.Relate(*tx, {.from_id = plan.id, .type = RelationshipType::kOrigin, .to_id = origin}));

  DayPlanRecord day{.day = 1, .current_city = org};
  assert(repo.CreateDayPlan(*tx, day));
  assert(repo.Relate(*tx, {.from_id = plan.id, .type = RelationshipType::kHasDayPlan, .to_id = day.id}));

  DayPlanRecord undated{.day = std::nullopt, .current_city = "-"};
  assert(repo.CreateDayPlan(*tx, undated));

  ActivityRecord lunch{.kind = ActivityKind::kMeal, .value = "Deep dish", .meal_slot = MealSlot::kLunch};
  assert(repo.CreateActivity(*tx, lunch));
  assert(repo.Relate(*tx, {.from_id = day.id, .type = RelationshipType::kHasMeal, .to_id = lunch.id}));

  ReferenceRecord reference{.description = "Visa", .content = "Not required"};
  assert(repo.CreateReference(*tx, reference));
  assert(repo.Relate(*tx, {.from_id = plan.id, .type = RelationshipType::kHasReference, .to_id = reference.id}));
  tx->Commit();

  auto read = repo.BeginReadOnly();
  auto stored = repo.GetTripPlan(*read, plan.id);
  assert(stored.has_value());
  assert(stored->org == org);
  assert(stored->people_number == 2);
  assert(stored->budget == 1234.5);
  assert(stored->annotated_plan == plan.annotated_plan);
  assert(stored->local_constraint == plan.local_constraint);

  auto stored_day = repo.GetDayPlan(*read, day.id);
  assert(stored_day.has_value());
  assert(stored_day->day == 1);
  auto stored_undated = repo.GetDayPlan(*read, undated.id);
  assert(stored_undated.has_value());
  assert(!stored_undated->day.has_value());

  auto stored_lunch = repo.GetActivity(*read, lunch.id);
  assert(stored_lunch.has_value());
  assert(stored_lunch->kind == ActivityKind::kMeal);
  assert(stored_lunch->meal_slot == MealSlot::kLunch);
  assert(stored_lunch->value == "Deep dish");

  auto stored_reference = repo.GetReference(*read, reference.id);
  assert(stored_reference.has_value());
  assert(stored_reference->content == "Not required");

  assert(repo.Outgoing(*read, plan.id, RelationshipType::kOrigin) == std::vector<NodeId>{origin});
  assert(repo.Outgoing(*read, plan.id, RelationshipType::kHasDayPlan) == std::vector<NodeId>{day.id});
  assert(repo.Outgoing(*read, day.id, RelationshipType::kHasMeal) == std::vector<NodeId>{lunch.id});
  assert(repo.Outgoing(*read, plan.id, RelationshipType::kDestination).empty());

  assert(!repo.GetTripPlan(*read, day.id).has_value());
  assert(!repo.GetActivity(*read, plan.id).has_value());
  read->Commit();
}

void VerifyRelateValidation(GraphRepository& repo, const std::string& city_name) {
  auto tx   = repo.Begin();
  auto city = Merge(repo, *tx, city_name);
  auto plan = MakePlan(city_name, city_name);
  assert(repo.CreateTripPlan(*tx, plan));

  const auto wrong_direction = repo.Relate(*tx, {.from_id = city, .type = RelationshipType::kOrigin, .to_id = plan.id});
  assert(!wrong_direction);
  assert(wrong_direction.code == ErrorCode::ConstraintViolation);

  const auto wrong_type = repo.Relate(*tx, {.from_id = plan.id, .type = RelationshipType::kInCity, .to_id = city});
  assert(wrong_type.code == ErrorCode::ConstraintViolation);

  const auto dangling = repo.Relate(*tx, {.from_id = plan.id, .type = RelationshipType::kOrigin, .to_id = plan.id + 1000000});
  assert(dangling.code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyRollbackBehavior(GraphRepository& repo, const std::string& city_name) {
  const auto cities = Nodes(repo, NodeLabel::kCity);
  const auto plans  = Nodes(repo, NodeLabel::kTripPlan);
  const auto edges  = Relationships(repo, RelationshipType::kOrigin);

  {
    auto tx   = repo.Begin();
    auto city = Merge(repo, *tx, city_name);
    auto plan = MakePlan(city_name, city_name);
    assert(repo.CreateTripPlan(*tx, plan));
    assert(repo.Relate(*tx, {.from_id = plan.id, .type = RelationshipType::kOrigin, .to_id = city}));
    tx->Rollback();
  }
  {
    // dropped without Commit
    auto tx = repo.Begin();
    Merge(repo, *tx, city_name);
  }

  assert(Nodes(repo, NodeLabel::kCity) == cities);
  assert(Nodes(repo, NodeLabel::kTripPlan) == plans);
  assert(Relationships(repo, RelationshipType::kOrigin) == edges);

  auto check = repo.BeginReadOnly();
  assert(!repo.FindCity(*check, city_name).has_value());
  check->Commit();
}

void VerifyReadOnlyTransactionsRejectWrites(GraphRepository& repo, const std::string& city_name) {
  auto       tx = repo.BeginReadOnly();
  CityRecord city{.name = city_name};
  assert(!repo.MergeCity(*tx, city));
  tx->Commit();
}

void VerifyFindTripPlans(GraphRepository& repo, const std::string& org, const std::string& dest) {
  std::vector<NodeId> ids;
  {
    auto tx = repo.Begin();
    for (const auto& [o, d] : std::vector<std::pair<std::string, std::string>>{{org, dest}, {org, dest + "x"}, {org + "x", dest}}) {
      auto plan = MakePlan(o, d);
      assert(repo.CreateTripPlan(*tx, plan));
      ids.push_back(plan.id);
    }
    tx->Commit();
  }

  auto tx = repo.BeginReadOnly();

  std::string upper_org = org;
  for (auto& c : upper_org) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  auto both = repo.FindTripPlans(*tx, TripPlanFilter{.origin = upper_org, .destination = dest});
  assert(both.size() == 1);
  assert(both[0].id == ids[0]);

  auto by_origin = repo.FindTripPlans(*tx, TripPlanFilter{.origin = org, .destination = std::nullopt});
  assert(by_origin.size() == 2);
  assert(by_origin[0].id == ids[0]);
  assert(by_origin[1].id == ids[1]);

  assert(repo.FindTripPlans(*tx, TripPlanFilter{.origin = org + "%", .destination = std::nullopt}).empty());
  assert(repo.FindTripPlans(*tx, TripPlanFilter{.origin = org.substr(0, 3), .destination = std::nullopt}).empty());
  tx->Commit();
}

void VerifySnapshotReads(GraphRepository& repo, const std::string& city_name) {
  auto reader = repo.BeginReadOnly();
  const auto before = repo.CountNodes(*reader, NodeLabel::kCity);

  {
    auto tx = repo.Begin();
    Merge(repo, *tx, city_name);
    tx->Commit();
  }

  // the open reader keeps its snapshot
  assert(repo.CountNodes(*reader, NodeLabel::kCity) == before);
  assert(!repo.FindCity(*reader, city_name).has_value());
  reader->Commit();

  assert(Nodes(repo, NodeLabel::kCity) == before + 1);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& city_name) {
  if (!backend.supports_restart()) {
    return;
  }

  auto   repo = backend.make_repository();
  NodeId id   = 0;
  {
    auto tx = repo->Begin();
    id      = Merge(*repo, *tx, city_name);
    tx->Commit();
  }

  backend.restart(repo);

  auto tx    = repo->Begin();
  auto found = repo->FindCity(*tx, city_name);
  assert(found.has_value());
  assert(found->id == id);
  assert(Merge(*repo, *tx, city_name) == id);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<GraphRepository>&) {},
      .cleanup          = []() {},
  };
}

#if TRIPGRAPH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = std::filesystem::temp_directory_path() / ("tripgraph_repository_parity_" + RunTag() + ".sqlite");

  auto make_repo = [db_path]() -> std::shared_ptr<GraphRepository> {
    auto writer = std::make_shared<tripgraph::db::sqlite::SqliteDB>(db_path.string());
    tripgraph::db::sqlite::BootstrapSchema(*writer);
    auto reader = std::make_shared<tripgraph::db::sqlite::SqliteDB>(db_path.string(), true);
    return std::make_shared<tripgraph::db::sqlite::SqliteRepository>(std::move(writer), std::move(reader));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<GraphRepository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path.string() + "-wal");
        std::filesystem::remove(db_path.string() + "-shm");
      },
  };
}
#endif

#if TRIPGRAPH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TRIPGRAPH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TRIPGRAPH_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<GraphRepository> {
    auto pool = std::make_shared<tripgraph::db::postgres::PgPool>(conninfo, 4);
    tripgraph::db::postgres::BootstrapSchema(*pool);
    return std::make_shared<tripgraph::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<GraphRepository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  const auto tag = backend.name + "-" + RunTag();
  VerifyCityMergeIsIdempotent(*repo, "Merge City " + tag);
  VerifyTripPlanReadWrite(*repo, "Origin " + tag, "Dest " + tag);
  VerifyRelateValidation(*repo, "Relate City " + tag);
  VerifyRollbackBehavior(*repo, "Rollback City " + tag);
  VerifyReadOnlyTransactionsRejectWrites(*repo, "Read Only City " + tag);
  VerifyFindTripPlans(*repo, "Find Origin " + tag, "Find Dest " + tag);
  VerifySnapshotReads(*repo, "Snapshot City " + tag);

  repo.reset();
  VerifyRestartDurability(backend, "Durable City " + tag);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TRIPGRAPH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TRIPGRAPH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "tripgraph_integration_repository_parity: pass\n";
  return 0;
}
