#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace tripgraph::db::sqlite {

/*
  Graph store on SQLite.

  Write transactions run on the writer connection. Read-only transactions
  run on the reader connection when one is given (the same connection
  otherwise, e.g. for ":memory:" databases).
*/
class SqliteRepository final : public db::GraphRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> writer, std::shared_ptr<SqliteDB> reader = nullptr);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginReadOnly() override;

  Result MergeCity(Transaction&, model::CityRecord&) override;
  Result CreateTripPlan(Transaction&, model::TripPlanRecord&) override;
  Result CreateDayPlan(Transaction&, model::DayPlanRecord&) override;
  Result CreateActivity(Transaction&, model::ActivityRecord&) override;
  Result CreateReference(Transaction&, model::ReferenceRecord&) override;
  Result Relate(Transaction&, const model::RelationshipRecord&) override;

  std::optional<model::CityRecord>      FindCity(Transaction&, const std::string&) override;
  std::optional<model::TripPlanRecord>  GetTripPlan(Transaction&, graph::NodeId) override;
  std::optional<model::DayPlanRecord>   GetDayPlan(Transaction&, graph::NodeId) override;
  std::optional<model::ActivityRecord>  GetActivity(Transaction&, graph::NodeId) override;
  std::optional<model::ReferenceRecord> GetReference(Transaction&, graph::NodeId) override;
  std::vector<graph::NodeId>            Outgoing(Transaction&, graph::NodeId, graph::RelationshipType) override;
  std::vector<model::TripPlanRecord>    FindTripPlans(Transaction&, const TripPlanFilter&) override;

  std::uint64_t CountNodes(Transaction&, graph::NodeLabel) override;
  std::uint64_t CountRelationships(Transaction&, graph::RelationshipType) override;

 private:
  std::unique_ptr<Transaction> Open(const std::shared_ptr<SqliteDB>& db, bool read_only);

  std::shared_ptr<SqliteDB> writer_;
  std::shared_ptr<SqliteDB> reader_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace tripgraph::db::sqlite
