#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace tripgraph::db::postgres {

class PgRepository final : public db::GraphRepository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::unique_ptr<Transaction> Open(bool read_only);

  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace tripgraph::db::postgres
