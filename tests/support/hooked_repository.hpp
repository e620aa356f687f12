#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace tripgraph::testing {

/*
  Forwards to a real repository and fails chosen steps on demand.

  Step names are the method names; Relate is keyed per type, e.g.
  "Relate:HAS_DAY_PLAN".
*/
class HookedRepository final : public db::GraphRepository {
 public:
  explicit HookedRepository(std::shared_ptr<db::GraphRepository> inner) : inner_(std::move(inner)) {
  }

  // times < 0 fails every call.
  void FailOn(const std::string& step, db::ErrorCode code, int times = -1) {
    std::lock_guard lock(mutex_);
    failures_[step] = {code, times};
  }

  int Calls(const std::string& step) {
    std::lock_guard lock(mutex_);
    return calls_[step];
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }
  std::unique_ptr<db::Transaction> BeginReadOnly() override {
    return inner_->BeginReadOnly();
  }

  db::Result MergeCity(db::Transaction& tx, db::model::CityRecord& r) override {
    if (auto failure = Hook("MergeCity"); !failure) return failure;
    return inner_->MergeCity(tx, r);
  }
  db::Result CreateTripPlan(db::Transaction& tx, db::model::TripPlanRecord& r) override {
    if (auto failure = Hook("CreateTripPlan"); !failure) return failure;
    return inner_->CreateTripPlan(tx, r);
  }
  db::Result CreateDayPlan(db::Transaction& tx, db::model::DayPlanRecord& r) override {
    if (auto failure = Hook("CreateDayPlan"); !failure) return failure;
    return inner_->CreateDayPlan(tx, r);
  }
  db::Result CreateActivity(db::Transaction& tx, db::model::ActivityRecord& r) override {
    if (auto failure = Hook("CreateActivity"); !failure) return failure;
    return inner_->CreateActivity(tx, r);
  }
  db::Result CreateReference(db::Transaction& tx, db::model::ReferenceRecord& r) override {
    if (auto failure = Hook("CreateReference"); !failure) return failure;
    return inner_->CreateReference(tx, r);
  }
  db::Result Relate(db::Transaction& tx, const db::model::RelationshipRecord& r) override {
    if (auto failure = Hook("Relate:" + std::string(graph::RelationshipName(r.type))); !failure) return failure;
    return inner_->Relate(tx, r);
  }

  std::optional<db::model::CityRecord> FindCity(db::Transaction& tx, const std::string& name) override {
    return inner_->FindCity(tx, name);
  }
  std::optional<db::model::TripPlanRecord> GetTripPlan(db::Transaction& tx, graph::NodeId id) override {
    return inner_->GetTripPlan(tx, id);
  }
  std::optional<db::model::DayPlanRecord> GetDayPlan(db::Transaction& tx, graph::NodeId id) override {
    return inner_->GetDayPlan(tx, id);
  }
  std::optional<db::model::ActivityRecord> GetActivity(db::Transaction& tx, graph::NodeId id) override {
    return inner_->GetActivity(tx, id);
  }
  std::optional<db::model::ReferenceRecord> GetReference(db::Transaction& tx, graph::NodeId id) override {
    return inner_->GetReference(tx, id);
  }
  std::vector<graph::NodeId> Outgoing(db::Transaction& tx, graph::NodeId from, graph::RelationshipType type) override {
    return inner_->Outgoing(tx, from, type);
  }
  std::vector<db::model::TripPlanRecord> FindTripPlans(db::Transaction& tx, const db::TripPlanFilter& filter) override {
    return inner_->FindTripPlans(tx, filter);
  }
  std::uint64_t CountNodes(db::Transaction& tx, graph::NodeLabel label) override {
    return inner_->CountNodes(tx, label);
  }
  std::uint64_t CountRelationships(db::Transaction& tx, graph::RelationshipType type) override {
    return inner_->CountRelationships(tx, type);
  }

 private:
  struct Failure {
    db::ErrorCode code;
    int           remaining;
  };

  db::Result Hook(const std::string& step) {
    std::lock_guard lock(mutex_);
    ++calls_[step];
    auto it = failures_.find(step);
    if (it == failures_.end() || it->second.remaining == 0) return db::Result::Ok();
    if (it->second.remaining > 0) --it->second.remaining;
    return db::Result::Err(it->second.code, "injected failure at " + step);
  }

  std::shared_ptr<db::GraphRepository> inner_;
  std::mutex                           mutex_;
  std::map<std::string, Failure>       failures_;
  std::map<std::string, int>           calls_;
};

} // namespace tripgraph::testing
