#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/activity_record.hpp"
#include "internal/db/model/city_record.hpp"
#include "internal/db/model/day_plan_record.hpp"
#include "internal/db/model/reference_record.hpp"
#include "internal/db/model/relationship_record.hpp"
#include "internal/db/model/trip_plan_record.hpp"
#include "internal/graph/schema.hpp"

namespace tripgraph::db {

// Case-insensitive match on the TripPlan's own org/dest attributes.
struct TripPlanFilter {
  std::string                origin;
  std::optional<std::string> destination;
};

/*
  Graph store abstraction.

  GUARANTEES:

  - All access goes through a Transaction
  - Node ids come from one id space shared by every label
  - MergeCity is idempotent: one City per distinct (case-sensitive) name,
    enforced by the store, not by callers
  - Relate is idempotent per (from, type, to) and rejects endpoints the
    schema does not allow
  - List results are ordered by node id (insertion order)

  Begin()/BeginReadOnly() throw util::SourceUnavailable when the store
  cannot be reached. So do FindTripPlans and the counters when the store
  fails mid-read, so a failed query is never mistaken for "no match".
  Point lookups log the failure and return empty. Everything else reports
  through Result.
*/

class GraphRepository {
 public:
  virtual ~GraphRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginReadOnly() = 0;

  // ---------------------------------------------------------------------
  // Node creation
  // ---------------------------------------------------------------------

  // Sets record.id to the existing or newly created City.
  virtual Result MergeCity(Transaction&, model::CityRecord& record) = 0;

  virtual Result CreateTripPlan(Transaction&, model::TripPlanRecord& record) = 0;

  virtual Result CreateDayPlan(Transaction&, model::DayPlanRecord& record) = 0;

  virtual Result CreateActivity(Transaction&, model::ActivityRecord& record) = 0;

  virtual Result CreateReference(Transaction&, model::ReferenceRecord& record) = 0;

  virtual Result Relate(Transaction&, const model::RelationshipRecord& relationship) = 0;

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  virtual std::optional<model::CityRecord> FindCity(Transaction&, const std::string& name) = 0;

  virtual std::optional<model::TripPlanRecord> GetTripPlan(Transaction&, graph::NodeId id) = 0;

  virtual std::optional<model::DayPlanRecord> GetDayPlan(Transaction&, graph::NodeId id) = 0;

  virtual std::optional<model::ActivityRecord> GetActivity(Transaction&, graph::NodeId id) = 0;

  virtual std::optional<model::ReferenceRecord> GetReference(Transaction&, graph::NodeId id) = 0;

  // Target ids of (from)-[type]->(...), ordered by target id.
  virtual std::vector<graph::NodeId> Outgoing(Transaction&, graph::NodeId from, graph::RelationshipType type) = 0;

  virtual std::vector<model::TripPlanRecord> FindTripPlans(Transaction&, const TripPlanFilter& filter) = 0;

  // ---------------------------------------------------------------------
  // Statistics
  // ---------------------------------------------------------------------

  virtual std::uint64_t CountNodes(Transaction&, graph::NodeLabel label) = 0;

  virtual std::uint64_t CountRelationships(Transaction&, graph::RelationshipType type) = 0;
};

} // namespace tripgraph::db
