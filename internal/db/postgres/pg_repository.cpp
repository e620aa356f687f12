#include "pg_repository.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace tripgraph::db::postgres {

namespace {

constexpr const char* kSelectTripPlan =
    "SELECT id,org,dest,days,visiting_city_number,date,people_number,local_constraint,budget,query,level,"
    "annotated_plan,reference_information FROM trip_plan";

model::TripPlanRecord ReadTripPlan(const pqxx::row& row) {
  model::TripPlanRecord r;
  r.id                    = row[0].as<std::int64_t>();
  r.org                   = row[1].c_str();
  r.dest                  = row[2].c_str();
  r.days                  = row[3].as<std::int64_t>();
  r.visiting_city_number  = row[4].as<std::int64_t>();
  r.date                  = row[5].c_str();
  r.people_number         = row[6].as<std::int64_t>();
  r.local_constraint      = row[7].c_str();
  r.budget                = row[8].as<double>();
  r.query                 = row[9].c_str();
  r.level                 = row[10].c_str();
  r.annotated_plan        = row[11].c_str();
  r.reference_information = row[12].c_str();
  return r;
}

Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write on a read-only transaction");
}

// Reads report store loss as SourceUnavailable and anything else as "no rows".
template <typename T, typename F>
T GuardRead(const char* op, F&& read) {
  try {
    return read();
  } catch (const pqxx::broken_connection& e) {
    throw util::SourceUnavailable(e.what());
  } catch (const pqxx::failure& e) {
    TRIPGRAPH_LOG_ERROR("postgres read failed", {observability::StringField("op", op), observability::StringField("error", e.what())});
    return T{};
  }
}

// Query-facing reads: any failure is SourceUnavailable, never an empty result.
template <typename T, typename F>
T GuardQuery(const char* op, F&& read) {
  try {
    return read();
  } catch (const pqxx::failure& e) {
    TRIPGRAPH_LOG_ERROR("postgres read failed", {observability::StringField("op", op), observability::StringField("error", e.what())});
    throw util::SourceUnavailable(std::string("postgres ") + op + ": " + e.what());
  }
}

graph::NodeId InsertNode(pqxx::transaction_base& tx, graph::NodeLabel label) {
  return tx.exec_prepared1("insert_node", std::string(graph::LabelName(label)))[0].as<graph::NodeId>();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Open(bool read_only) {
  try {
    return std::make_unique<PgTransaction>(pool_, read_only);
  } catch (const pqxx::broken_connection& e) {
    throw util::SourceUnavailable(std::string("postgres: ") + e.what());
  } catch (const pqxx::failure& e) {
    throw util::SourceUnavailable(std::string("postgres: ") + e.what());
  }
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return Open(false);
}

std::unique_ptr<db::Transaction> PgRepository::BeginReadOnly() {
  return Open(true);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) || dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::MergeCity(Transaction& t, model::CityRecord& r) {
  auto& tx = TX(t).Work();
  try {
    auto existing = tx.exec_prepared("find_city", r.name);
    if (!existing.empty()) {
      r.id = existing[0][0].as<graph::NodeId>();
      return Result::Ok();
    }
    if (t.IsReadOnly()) return ReadOnlyError();

    // UNIQUE(name) arbitrates between concurrent writers; the loser drops
    // its node and adopts the committed City.
    const auto id       = InsertNode(tx, graph::NodeLabel::kCity);
    auto       inserted = tx.exec_prepared("insert_city", id, r.name);
    if (!inserted.empty()) {
      r.id = id;
      return Result::Ok();
    }

    tx.exec_prepared("delete_node", id);
    auto winner = tx.exec_prepared("find_city", r.name);
    if (winner.empty()) {
      return Result::Err(ErrorCode::Conflict, "city " + r.name + " vanished during merge");
    }
    r.id = winner[0][0].as<graph::NodeId>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CreateTripPlan(Transaction& t, model::TripPlanRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto& tx = TX(t).Work();
  try {
    r.id = InsertNode(tx, graph::NodeLabel::kTripPlan);
    tx.exec_prepared("insert_trip_plan", r.id, r.org, r.dest, util::FoldCase(r.org), util::FoldCase(r.dest), r.days,
                     r.visiting_city_number, r.date, r.people_number, r.local_constraint, r.budget, r.query, r.level,
                     r.annotated_plan, r.reference_information);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CreateDayPlan(Transaction& t, model::DayPlanRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto& tx = TX(t).Work();
  try {
    r.id = InsertNode(tx, graph::NodeLabel::kDayPlan);
    tx.exec_prepared("insert_day_plan", r.id, r.day, r.current_city);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CreateActivity(Transaction& t, model::ActivityRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  if (r.kind != graph::ActivityKind::kMeal) r.meal_slot = graph::MealSlot::kNone;

  auto& tx = TX(t).Work();
  try {
    std::optional<std::string> meal_type;
    if (r.meal_slot != graph::MealSlot::kNone) meal_type = std::string(graph::MealSlotName(r.meal_slot));

    r.id = InsertNode(tx, graph::LabelFor(r.kind));
    tx.exec_prepared("insert_activity", r.id, static_cast<int>(r.kind), r.value, meal_type);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CreateReference(Transaction& t, model::ReferenceRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto& tx = TX(t).Work();
  try {
    r.id = InsertNode(tx, graph::NodeLabel::kReferenceInfo);
    tx.exec_prepared("insert_reference", r.id, r.description, r.content);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::Relate(Transaction& t, const model::RelationshipRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto& tx = TX(t).Work();
  try {
    auto from = tx.exec_prepared("node_label", r.from_id);
    auto to   = tx.exec_prepared("node_label", r.to_id);
    if (from.empty() || to.empty()) {
      return Result::Err(ErrorCode::NotFound, "relationship endpoint does not exist");
    }

    auto from_label = graph::ParseLabel(from[0][0].c_str());
    auto to_label   = graph::ParseLabel(to[0][0].c_str());
    if (!from_label || !to_label) {
      return Result::Err(ErrorCode::Corruption, "unknown node label in store");
    }
    if (!graph::AllowsEndpoints(r.type, *from_label, *to_label)) {
      return Result::Err(ErrorCode::ConstraintViolation, std::string(graph::RelationshipName(r.type)) + " cannot connect " +
                                                              std::string(graph::LabelName(*from_label)) + " to " +
                                                              std::string(graph::LabelName(*to_label)));
    }

    tx.exec_prepared("insert_relationship", r.from_id, std::string(graph::RelationshipName(r.type)), r.to_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CityRecord> PgRepository::FindCity(Transaction& t, const std::string& name) {
  return GuardRead<std::optional<model::CityRecord>>("FindCity", [&]() -> std::optional<model::CityRecord> {
    auto res = TX(t).Work().exec_prepared("find_city", name);
    if (res.empty()) return std::nullopt;
    return model::CityRecord{.id = res[0][0].as<graph::NodeId>(), .name = res[0][1].c_str()};
  });
}

std::optional<model::TripPlanRecord> PgRepository::GetTripPlan(Transaction& t, graph::NodeId id) {
  return GuardRead<std::optional<model::TripPlanRecord>>("GetTripPlan", [&]() -> std::optional<model::TripPlanRecord> {
    auto res = TX(t).Work().exec_params(std::string(kSelectTripPlan) + " WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;
    return ReadTripPlan(res[0]);
  });
}

std::optional<model::DayPlanRecord> PgRepository::GetDayPlan(Transaction& t, graph::NodeId id) {
  return GuardRead<std::optional<model::DayPlanRecord>>("GetDayPlan", [&]() -> std::optional<model::DayPlanRecord> {
    auto res = TX(t).Work().exec_params("SELECT id,day,current_city FROM day_plan WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;

    model::DayPlanRecord r;
    r.id = res[0][0].as<graph::NodeId>();
    if (!res[0][1].is_null()) r.day = res[0][1].as<std::int64_t>();
    r.current_city = res[0][2].c_str();
    return r;
  });
}

std::optional<model::ActivityRecord> PgRepository::GetActivity(Transaction& t, graph::NodeId id) {
  return GuardRead<std::optional<model::ActivityRecord>>("GetActivity", [&]() -> std::optional<model::ActivityRecord> {
    auto res = TX(t).Work().exec_params("SELECT id,kind,value,meal_type FROM activity WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;

    model::ActivityRecord r;
    r.id    = res[0][0].as<graph::NodeId>();
    r.kind  = static_cast<graph::ActivityKind>(res[0][1].as<int>());
    r.value = res[0][2].c_str();
    if (!res[0][3].is_null()) r.meal_slot = graph::ParseMealSlot(res[0][3].c_str()).value_or(graph::MealSlot::kNone);
    return r;
  });
}

std::optional<model::ReferenceRecord> PgRepository::GetReference(Transaction& t, graph::NodeId id) {
  return GuardRead<std::optional<model::ReferenceRecord>>("GetReference", [&]() -> std::optional<model::ReferenceRecord> {
    auto res = TX(t).Work().exec_params("SELECT id,description,content FROM reference_info WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;
    return model::ReferenceRecord{.id = res[0][0].as<graph::NodeId>(), .description = res[0][1].c_str(), .content = res[0][2].c_str()};
  });
}

std::vector<graph::NodeId> PgRepository::Outgoing(Transaction& t, graph::NodeId from, graph::RelationshipType type) {
  return GuardRead<std::vector<graph::NodeId>>("Outgoing", [&] {
    auto res = TX(t).Work().exec_prepared("outgoing", from, std::string(graph::RelationshipName(type)));

    std::vector<graph::NodeId> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(row[0].as<graph::NodeId>());
    }
    return out;
  });
}

std::vector<model::TripPlanRecord> PgRepository::FindTripPlans(Transaction& t, const TripPlanFilter& filter) {
  return GuardQuery<std::vector<model::TripPlanRecord>>("FindTripPlans", [&] {
    auto& tx = TX(t).Work();
    auto  res = filter.destination
                    ? tx.exec_params(std::string(kSelectTripPlan) + " WHERE org_key=$1 AND dest_key=$2 ORDER BY id;",
                                     util::FoldCase(filter.origin), util::FoldCase(*filter.destination))
                    : tx.exec_params(std::string(kSelectTripPlan) + " WHERE org_key=$1 ORDER BY id;", util::FoldCase(filter.origin));

    std::vector<model::TripPlanRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadTripPlan(row));
    }
    return out;
  });
}

std::uint64_t PgRepository::CountNodes(Transaction& t, graph::NodeLabel label) {
  return GuardQuery<std::uint64_t>("CountNodes", [&] {
    return TX(t).Work().exec_prepared1("count_nodes", std::string(graph::LabelName(label)))[0].as<std::uint64_t>();
  });
}

std::uint64_t PgRepository::CountRelationships(Transaction& t, graph::RelationshipType type) {
  return GuardQuery<std::uint64_t>("CountRelationships", [&] {
    return TX(t).Work().exec_prepared1("count_relationships", std::string(graph::RelationshipName(type)))[0].as<std::uint64_t>();
  });
}

} // namespace tripgraph::db::postgres
