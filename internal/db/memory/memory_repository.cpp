#include "memory_repository.hpp"

#include <algorithm>
#include <limits>

#include "internal/util/strings.hpp"
#include "memory_tx.hpp"

namespace tripgraph::db::memory {

namespace {

template <typename Map, typename Key>
const typename Map::mapped_type* Lookup(const Map& base, const Map& pending, const Key& key) {
  if (auto it = base.find(key); it != base.end()) return &it->second;
  if (auto it = pending.find(key); it != pending.end()) return &it->second;
  return nullptr;
}

Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write on a read-only transaction");
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginReadOnly() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::MergeCity(Transaction& t, model::CityRecord& r) {
  auto& tx = TX(t);
  if (const auto* id = Lookup(tx.Base().city_by_name, tx.Pending().city_by_name, r.name)) {
    r.id = *id;
    return Result::Ok();
  }
  if (tx.IsReadOnly()) return ReadOnlyError();

  auto& s = tx.Mutable();
  r.id    = s.next_id++;
  s.labels.emplace(r.id, graph::NodeLabel::kCity);
  s.cities.emplace(r.id, r);
  s.city_by_name.emplace(r.name, r.id);
  return Result::Ok();
}

Result MemoryRepository::CreateTripPlan(Transaction& t, model::TripPlanRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto& s = TX(t).Mutable();
  r.id    = s.next_id++;
  s.labels.emplace(r.id, graph::NodeLabel::kTripPlan);
  s.trip_plans.emplace(r.id, r);
  return Result::Ok();
}

Result MemoryRepository::CreateDayPlan(Transaction& t, model::DayPlanRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto& s = TX(t).Mutable();
  r.id    = s.next_id++;
  s.labels.emplace(r.id, graph::NodeLabel::kDayPlan);
  s.day_plans.emplace(r.id, r);
  return Result::Ok();
}

Result MemoryRepository::CreateActivity(Transaction& t, model::ActivityRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  if (r.kind != graph::ActivityKind::kMeal) r.meal_slot = graph::MealSlot::kNone;

  auto& s = TX(t).Mutable();
  r.id    = s.next_id++;
  s.labels.emplace(r.id, graph::LabelFor(r.kind));
  s.activities.emplace(r.id, r);
  return Result::Ok();
}

Result MemoryRepository::CreateReference(Transaction& t, model::ReferenceRecord& r) {
  if (t.IsReadOnly()) return ReadOnlyError();
  auto& s = TX(t).Mutable();
  r.id    = s.next_id++;
  s.labels.emplace(r.id, graph::NodeLabel::kReferenceInfo);
  s.references.emplace(r.id, r);
  return Result::Ok();
}

Result MemoryRepository::Relate(Transaction& t, const model::RelationshipRecord& r) {
  auto& tx = TX(t);
  if (tx.IsReadOnly()) return ReadOnlyError();

  const auto* from = Lookup(tx.Base().labels, tx.Pending().labels, r.from_id);
  const auto* to   = Lookup(tx.Base().labels, tx.Pending().labels, r.to_id);
  if (!from || !to) {
    return Result::Err(ErrorCode::NotFound, "relationship endpoint does not exist");
  }
  if (!graph::AllowsEndpoints(r.type, *from, *to)) {
    return Result::Err(ErrorCode::ConstraintViolation,
                       std::string(graph::RelationshipName(r.type)) + " cannot connect " + std::string(graph::LabelName(*from)) + " to " +
                           std::string(graph::LabelName(*to)));
  }

  RelationshipKey key{r.from_id, static_cast<int>(r.type), r.to_id};
  if (tx.Base().relationships.contains(key)) return Result::Ok();
  tx.Mutable().relationships.insert(key);
  return Result::Ok();
}

std::optional<model::CityRecord> MemoryRepository::FindCity(Transaction& t, const std::string& name) {
  auto&       tx = TX(t);
  const auto* id = Lookup(tx.Base().city_by_name, tx.Pending().city_by_name, name);
  if (!id) return std::nullopt;
  return *Lookup(tx.Base().cities, tx.Pending().cities, *id);
}

std::optional<model::TripPlanRecord> MemoryRepository::GetTripPlan(Transaction& t, graph::NodeId id) {
  const auto* r = Lookup(TX(t).Base().trip_plans, TX(t).Pending().trip_plans, id);
  if (!r) return std::nullopt;
  return *r;
}

std::optional<model::DayPlanRecord> MemoryRepository::GetDayPlan(Transaction& t, graph::NodeId id) {
  const auto* r = Lookup(TX(t).Base().day_plans, TX(t).Pending().day_plans, id);
  if (!r) return std::nullopt;
  return *r;
}

std::optional<model::ActivityRecord> MemoryRepository::GetActivity(Transaction& t, graph::NodeId id) {
  const auto* r = Lookup(TX(t).Base().activities, TX(t).Pending().activities, id);
  if (!r) return std::nullopt;
  return *r;
}

std::optional<model::ReferenceRecord> MemoryRepository::GetReference(Transaction& t, graph::NodeId id) {
  const auto* r = Lookup(TX(t).Base().references, TX(t).Pending().references, id);
  if (!r) return std::nullopt;
  return *r;
}

std::vector<graph::NodeId> MemoryRepository::Outgoing(Transaction& t, graph::NodeId from, graph::RelationshipType type) {
  const RelationshipKey lo{from, static_cast<int>(type), std::numeric_limits<graph::NodeId>::min()};
  const RelationshipKey hi{from, static_cast<int>(type), std::numeric_limits<graph::NodeId>::max()};

  std::vector<graph::NodeId> out;
  for (const auto* layer : {&TX(t).Base(), &TX(t).Pending()}) {
    auto end = layer->relationships.upper_bound(hi);
    for (auto it = layer->relationships.lower_bound(lo); it != end; ++it) {
      out.push_back(std::get<2>(*it));
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<model::TripPlanRecord> MemoryRepository::FindTripPlans(Transaction& t, const TripPlanFilter& filter) {
  const auto origin      = util::FoldCase(filter.origin);
  const auto destination = filter.destination ? std::optional(util::FoldCase(*filter.destination)) : std::nullopt;

  std::vector<model::TripPlanRecord> out;
  // pending ids are always above the snapshot's, so base-then-pending is id order
  for (const auto* layer : {&TX(t).Base(), &TX(t).Pending()}) {
    for (const auto& [_, plan] : layer->trip_plans) {
      if (util::FoldCase(plan.org) != origin) continue;
      if (destination && util::FoldCase(plan.dest) != *destination) continue;
      out.push_back(plan);
    }
  }
  return out;
}

std::uint64_t MemoryRepository::CountNodes(Transaction& t, graph::NodeLabel label) {
  std::uint64_t count = 0;
  for (const auto* layer : {&TX(t).Base(), &TX(t).Pending()}) {
    count += std::count_if(layer->labels.begin(), layer->labels.end(), [label](const auto& entry) { return entry.second == label; });
  }
  return count;
}

std::uint64_t MemoryRepository::CountRelationships(Transaction& t, graph::RelationshipType type) {
  std::uint64_t count = 0;
  for (const auto* layer : {&TX(t).Base(), &TX(t).Pending()}) {
    count += std::count_if(layer->relationships.begin(), layer->relationships.end(),
                           [type](const auto& key) { return std::get<1>(key) == static_cast<int>(type); });
  }
  return count;
}

} // namespace tripgraph::db::memory
