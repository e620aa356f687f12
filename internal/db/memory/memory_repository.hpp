#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <tuple>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace tripgraph::db::memory {

class MemoryTransaction;

/*
  In-process graph store.

  Committed state is an immutable snapshot behind a shared_ptr. Readers pin
  the snapshot they started on; one writer at a time collects new nodes and
  relationships in a private layer that Commit() folds into a fresh
  snapshot (or the current one, when nobody else holds it).
*/
class MemoryRepository final : public db::GraphRepository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  using RelationshipKey = std::tuple<graph::NodeId, int, graph::NodeId>;

  struct State {
    graph::NodeId next_id = 1;

    std::map<graph::NodeId, graph::NodeLabel>       labels;
    std::map<graph::NodeId, model::CityRecord>      cities;
    std::unordered_map<std::string, graph::NodeId>  city_by_name;
    std::map<graph::NodeId, model::TripPlanRecord>  trip_plans;
    std::map<graph::NodeId, model::DayPlanRecord>   day_plans;
    std::map<graph::NodeId, model::ActivityRecord>  activities;
    std::map<graph::NodeId, model::ReferenceRecord> references;
    std::set<RelationshipKey>                       relationships;
  };

  // held by a write transaction from Begin() until it finishes
  std::mutex writer_mutex_;

  std::mutex             state_mutex_;
  std::shared_ptr<State> committed_;
};

} // namespace tripgraph::db::memory
