#include "sqlite_repository.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace tripgraph::db::sqlite {

namespace {

constexpr const char* kSelectTripPlan =
    "SELECT id,org,dest,days,visiting_city_number,date,people_number,local_constraint,budget,query,level,"
    "annotated_plan,reference_information FROM trip_plan";

model::TripPlanRecord ReadTripPlan(const SqliteStatement& st) {
  model::TripPlanRecord r;
  r.id                    = st.Int64(0);
  r.org                   = st.Text(1);
  r.dest                  = st.Text(2);
  r.days                  = st.Int64(3);
  r.visiting_city_number  = st.Int64(4);
  r.date                  = st.Text(5);
  r.people_number         = st.Int64(6);
  r.local_constraint      = st.Text(7);
  r.budget                = st.Double(8);
  r.query                 = st.Text(9);
  r.level                 = st.Text(10);
  r.annotated_plan        = st.Text(11);
  r.reference_information = st.Text(12);
  return r;
}

void LogReadFailure(const char* op, const SqliteError& e) {
  TRIPGRAPH_LOG_ERROR("sqlite read failed", {observability::StringField("op", op), observability::StringField("error", e.what())});
}

[[noreturn]] void ThrowQueryFailure(const char* op, const SqliteError& e) {
  LogReadFailure(op, e);
  throw util::SourceUnavailable(std::string("sqlite ") + op + ": " + e.what());
}

Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write on a read-only transaction");
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> writer, std::shared_ptr<SqliteDB> reader)
    : writer_(std::move(writer)), reader_(reader ? std::move(reader) : writer_) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Open(const std::shared_ptr<SqliteDB>& db, bool read_only) {
  try {
    return std::make_unique<SqliteTransaction>(db, read_only);
  } catch (const SqliteError& e) {
    if (e.Code() == SQLITE_BUSY || e.Code() == SQLITE_LOCKED) {
      throw util::WriteConflict(ErrorCode::Busy, std::string("sqlite begin: ") + e.what());
    }
    throw util::SourceUnavailable(db->Path() + ": " + e.what());
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return Open(writer_, false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginReadOnly() {
  return Open(reader_, true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::Unsupported, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

namespace {

// Allocates an id in the shared node table.
Result InsertNode(sqlite3* db, graph::NodeLabel label, graph::NodeId& id) {
  SqliteStatement st(db, "INSERT INTO node(label) VALUES(?);");
  st.Bind(1, std::string(graph::LabelName(label)));
  int rc = st.Step();
  if (rc != SQLITE_DONE) {
    return Result::Err(rc == SQLITE_BUSY ? ErrorCode::Busy : ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  id = static_cast<graph::NodeId>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::optional<graph::NodeLabel> NodeLabelOf(sqlite3* db, graph::NodeId id) {
  SqliteStatement st(db, "SELECT label FROM node WHERE id=?;");
  st.Bind(1, static_cast<std::int64_t>(id));
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return graph::ParseLabel(st.Text(0));
}

} // namespace

Result SqliteRepository::MergeCity(Transaction& t, model::CityRecord& r) {
  auto* db = TX(t).Handle();
  try {
    {
      SqliteStatement st(db, "SELECT id FROM city WHERE name=?;");
      st.Bind(1, r.name);
      if (st.Step() == SQLITE_ROW) {
        r.id = st.Int64(0);
        return Result::Ok();
      }
    }
    if (t.IsReadOnly()) return ReadOnlyError();

    if (auto res = InsertNode(db, graph::NodeLabel::kCity, r.id); !res) return res;

    SqliteStatement st(db, "INSERT INTO city(id,name) VALUES(?,?);");
    st.Bind(1, static_cast<std::int64_t>(r.id));
    st.Bind(2, r.name);
    return Translate(db, st.Step());
  } catch (const SqliteError& e) {
    return Translate(db, e.Code());
  }
}

Result SqliteRepository::CreateTripPlan(Transaction& t, model::TripPlanRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto* db = TX(t).Handle();
  try {
    if (auto res = InsertNode(db, graph::NodeLabel::kTripPlan, r.id); !res) return res;

    SqliteStatement st(db,
                       "INSERT INTO trip_plan(id,org,dest,org_key,dest_key,days,visiting_city_number,date,people_number,"
                       "local_constraint,budget,query,level,annotated_plan,reference_information) "
                       "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
    st.Bind(1, static_cast<std::int64_t>(r.id));
    st.Bind(2, r.org);
    st.Bind(3, r.dest);
    st.Bind(4, util::FoldCase(r.org));
    st.Bind(5, util::FoldCase(r.dest));
    st.Bind(6, r.days);
    st.Bind(7, r.visiting_city_number);
    st.Bind(8, r.date);
    st.Bind(9, r.people_number);
    st.Bind(10, r.local_constraint);
    st.Bind(11, r.budget);
    st.Bind(12, r.query);
    st.Bind(13, r.level);
    st.Bind(14, r.annotated_plan);
    st.Bind(15, r.reference_information);
    return Translate(db, st.Step());
  } catch (const SqliteError& e) {
    return Translate(db, e.Code());
  }
}

Result SqliteRepository::CreateDayPlan(Transaction& t, model::DayPlanRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto* db = TX(t).Handle();
  try {
    if (auto res = InsertNode(db, graph::NodeLabel::kDayPlan, r.id); !res) return res;

    SqliteStatement st(db, "INSERT INTO day_plan(id,day,current_city) VALUES(?,?,?);");
    st.Bind(1, static_cast<std::int64_t>(r.id));
    if (r.day) {
      st.Bind(2, *r.day);
    } else {
      st.BindNull(2);
    }
    st.Bind(3, r.current_city);
    return Translate(db, st.Step());
  } catch (const SqliteError& e) {
    return Translate(db, e.Code());
  }
}

Result SqliteRepository::CreateActivity(Transaction& t, model::ActivityRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  if (r.kind != graph::ActivityKind::kMeal) r.meal_slot = graph::MealSlot::kNone;

  auto* db = TX(t).Handle();
  try {
    if (auto res = InsertNode(db, graph::LabelFor(r.kind), r.id); !res) return res;

    SqliteStatement st(db, "INSERT INTO activity(id,kind,value,meal_type) VALUES(?,?,?,?);");
    st.Bind(1, static_cast<std::int64_t>(r.id));
    st.Bind(2, static_cast<std::int64_t>(r.kind));
    st.Bind(3, r.value);
    if (r.meal_slot == graph::MealSlot::kNone) {
      st.BindNull(4);
    } else {
      st.Bind(4, std::string(graph::MealSlotName(r.meal_slot)));
    }
    return Translate(db, st.Step());
  } catch (const SqliteError& e) {
    return Translate(db, e.Code());
  }
}

Result SqliteRepository::CreateReference(Transaction& t, model::ReferenceRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto* db = TX(t).Handle();
  try {
    if (auto res = InsertNode(db, graph::NodeLabel::kReferenceInfo, r.id); !res) return res;

    SqliteStatement st(db, "INSERT INTO reference_info(id,description,content) VALUES(?,?,?);");
    st.Bind(1, static_cast<std::int64_t>(r.id));
    st.Bind(2, r.description);
    st.Bind(3, r.content);
    return Translate(db, st.Step());
  } catch (const SqliteError& e) {
    return Translate(db, e.Code());
  }
}

// ------------------------------------------------------------------
// Relationships
// ------------------------------------------------------------------

Result SqliteRepository::Relate(Transaction& t, const model::RelationshipRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto* db = TX(t).Handle();
  try {
    auto from = NodeLabelOf(db, r.from_id);
    auto to   = NodeLabelOf(db, r.to_id);
    if (!from || !to) {
      return Result::Err(ErrorCode::NotFound, "relationship endpoint does not exist");
    }
    if (!graph::AllowsEndpoints(r.type, *from, *to)) {
      return Result::Err(ErrorCode::ConstraintViolation, std::string(graph::RelationshipName(r.type)) + " cannot connect " +
                                                              std::string(graph::LabelName(*from)) + " to " +
                                                              std::string(graph::LabelName(*to)));
    }

    SqliteStatement st(db, "INSERT OR IGNORE INTO relationship(from_id,type,to_id) VALUES(?,?,?);");
    st.Bind(1, static_cast<std::int64_t>(r.from_id));
    st.Bind(2, std::string(graph::RelationshipName(r.type)));
    st.Bind(3, static_cast<std::int64_t>(r.to_id));
    return Translate(db, st.Step());
  } catch (const SqliteError& e) {
    return Translate(db, e.Code());
  }
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<model::CityRecord> SqliteRepository::FindCity(Transaction& t, const std::string& name) {
  try {
    SqliteStatement st(TX(t).Handle(), "SELECT id,name FROM city WHERE name=?;");
    st.Bind(1, name);
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return model::CityRecord{.id = st.Int64(0), .name = st.Text(1)};
  } catch (const SqliteError& e) {
    LogReadFailure("FindCity", e);
    return std::nullopt;
  }
}

std::optional<model::TripPlanRecord> SqliteRepository::GetTripPlan(Transaction& t, graph::NodeId id) {
  try {
    SqliteStatement st(TX(t).Handle(), (std::string(kSelectTripPlan) + " WHERE id=?;").c_str());
    st.Bind(1, static_cast<std::int64_t>(id));
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return ReadTripPlan(st);
  } catch (const SqliteError& e) {
    LogReadFailure("GetTripPlan", e);
    return std::nullopt;
  }
}

std::optional<model::DayPlanRecord> SqliteRepository::GetDayPlan(Transaction& t, graph::NodeId id) {
  try {
    SqliteStatement st(TX(t).Handle(), "SELECT id,day,current_city FROM day_plan WHERE id=?;");
    st.Bind(1, static_cast<std::int64_t>(id));
    if (st.Step() != SQLITE_ROW) return std::nullopt;

    model::DayPlanRecord r;
    r.id = st.Int64(0);
    if (!st.IsNull(1)) r.day = st.Int64(1);
    r.current_city = st.Text(2);
    return r;
  } catch (const SqliteError& e) {
    LogReadFailure("GetDayPlan", e);
    return std::nullopt;
  }
}

std::optional<model::ActivityRecord> SqliteRepository::GetActivity(Transaction& t, graph::NodeId id) {
  try {
    SqliteStatement st(TX(t).Handle(), "SELECT id,kind,value,meal_type FROM activity WHERE id=?;");
    st.Bind(1, static_cast<std::int64_t>(id));
    if (st.Step() != SQLITE_ROW) return std::nullopt;

    model::ActivityRecord r;
    r.id        = st.Int64(0);
    r.kind      = static_cast<graph::ActivityKind>(st.Int64(1));
    r.value     = st.Text(2);
    r.meal_slot = st.IsNull(3) ? graph::MealSlot::kNone : graph::ParseMealSlot(st.Text(3)).value_or(graph::MealSlot::kNone);
    return r;
  } catch (const SqliteError& e) {
    LogReadFailure("GetActivity", e);
    return std::nullopt;
  }
}

std::optional<model::ReferenceRecord> SqliteRepository::GetReference(Transaction& t, graph::NodeId id) {
  try {
    SqliteStatement st(TX(t).Handle(), "SELECT id,description,content FROM reference_info WHERE id=?;");
    st.Bind(1, static_cast<std::int64_t>(id));
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return model::ReferenceRecord{.id = st.Int64(0), .description = st.Text(1), .content = st.Text(2)};
  } catch (const SqliteError& e) {
    LogReadFailure("GetReference", e);
    return std::nullopt;
  }
}

std::vector<graph::NodeId> SqliteRepository::Outgoing(Transaction& t, graph::NodeId from, graph::RelationshipType type) {
  std::vector<graph::NodeId> out;
  try {
    SqliteStatement st(TX(t).Handle(), "SELECT to_id FROM relationship WHERE from_id=? AND type=? ORDER BY to_id;");
    st.Bind(1, static_cast<std::int64_t>(from));
    st.Bind(2, std::string(graph::RelationshipName(type)));
    while (st.Step() == SQLITE_ROW) {
      out.push_back(st.Int64(0));
    }
  } catch (const SqliteError& e) {
    LogReadFailure("Outgoing", e);
  }
  return out;
}

std::vector<model::TripPlanRecord> SqliteRepository::FindTripPlans(Transaction& t, const TripPlanFilter& filter) {
  std::vector<model::TripPlanRecord> out;
  try {
    std::string sql = std::string(kSelectTripPlan) + " WHERE org_key=?";
    if (filter.destination) sql += " AND dest_key=?";
    sql += " ORDER BY id;";

    SqliteStatement st(TX(t).Handle(), sql.c_str());
    st.Bind(1, util::FoldCase(filter.origin));
    if (filter.destination) st.Bind(2, util::FoldCase(*filter.destination));
    while (st.Step() == SQLITE_ROW) {
      out.push_back(ReadTripPlan(st));
    }
  } catch (const SqliteError& e) {
    ThrowQueryFailure("FindTripPlans", e);
  }
  return out;
}

// ------------------------------------------------------------------
// Statistics
// ------------------------------------------------------------------

std::uint64_t SqliteRepository::CountNodes(Transaction& t, graph::NodeLabel label) {
  try {
    SqliteStatement st(TX(t).Handle(), "SELECT COUNT(*) FROM node WHERE label=?;");
    st.Bind(1, std::string(graph::LabelName(label)));
    if (st.Step() != SQLITE_ROW) return 0;
    return static_cast<std::uint64_t>(st.Int64(0));
  } catch (const SqliteError& e) {
    ThrowQueryFailure("CountNodes", e);
  }
}

std::uint64_t SqliteRepository::CountRelationships(Transaction& t, graph::RelationshipType type) {
  try {
    SqliteStatement st(TX(t).Handle(), "SELECT COUNT(*) FROM relationship WHERE type=?;");
    st.Bind(1, std::string(graph::RelationshipName(type)));
    if (st.Step() != SQLITE_ROW) return 0;
    return static_cast<std::uint64_t>(st.Int64(0));
  } catch (const SqliteError& e) {
    ThrowQueryFailure("CountRelationships", e);
  }
}

} // namespace tripgraph::db::sqlite
