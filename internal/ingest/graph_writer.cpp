#include "graph_writer.hpp"

#include <string>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace tripgraph::ingest {

namespace {

void Check(const db::Result& result, const char* step) {
  if (!result) {
    throw util::WriteConflict(result.code, std::string(step) + ": " + result.message);
  }
}

graph::NodeId MergeCity(db::GraphRepository& repo, db::Transaction& tx, const std::string& name) {
  db::model::CityRecord city;
  city.name = name;
  Check(repo.MergeCity(tx, city), "merge city");
  return city.id;
}

void Relate(db::GraphRepository& repo, db::Transaction& tx, graph::NodeId from, graph::RelationshipType type, graph::NodeId to) {
  Check(repo.Relate(tx, {.from_id = from, .type = type, .to_id = to}), "relate");
}

} // namespace

GraphWriter::GraphWriter(std::shared_ptr<db::GraphRepository> repository) : repository_(std::move(repository)) {
}

WriteOutcome GraphWriter::Write(const NormalizedTrip& trip) {
  observability::SpanScope span("tripgraph.ingest.write_record");
  span.SetAttribute("trip.org", trip.org);
  span.SetAttribute("trip.dest", trip.dest);

  auto& repo = *repository_;
  auto  tx   = repo.Begin();

  WriteOutcome outcome;

  const auto origin_id      = MergeCity(repo, *tx, trip.org);
  const auto destination_id = MergeCity(repo, *tx, trip.dest);

  db::model::TripPlanRecord plan;
  plan.org                   = trip.org;
  plan.dest                  = trip.dest;
  plan.days                  = trip.days;
  plan.visiting_city_number  = trip.visiting_city_number;
  plan.date                  = trip.date;
  plan.people_number         = trip.people_number;
  plan.local_constraint      = trip.local_constraint;
  plan.budget                = trip.budget;
  plan.query                 = trip.query;
  plan.level                 = trip.level;
  plan.annotated_plan        = trip.annotated_plan;
  plan.reference_information = trip.reference_information;
  Check(repo.CreateTripPlan(*tx, plan), "create trip plan");
  outcome.trip_plan_id = plan.id;

  Relate(repo, *tx, plan.id, graph::RelationshipType::kOrigin, origin_id);
  Relate(repo, *tx, plan.id, graph::RelationshipType::kDestination, destination_id);

  for (const auto& day : trip.day_plans) {
    db::model::DayPlanRecord day_plan;
    day_plan.day          = day.day;
    day_plan.current_city = day.current_city;
    Check(repo.CreateDayPlan(*tx, day_plan), "create day plan");
    Relate(repo, *tx, plan.id, graph::RelationshipType::kHasDayPlan, day_plan.id);
    ++outcome.day_plans;

    if (!util::IsPlaceholder(day.current_city)) {
      Relate(repo, *tx, day_plan.id, graph::RelationshipType::kInCity, MergeCity(repo, *tx, day.current_city));
    }

    for (const auto& activity : day.activities) {
      db::model::ActivityRecord node;
      node.kind      = activity.kind;
      node.value     = activity.value;
      node.meal_slot = activity.meal_slot;
      Check(repo.CreateActivity(*tx, node), "create activity");
      Relate(repo, *tx, day_plan.id, graph::RelationshipFor(activity.kind), node.id);
      ++outcome.activities;
    }
  }

  for (const auto& reference : trip.references) {
    db::model::ReferenceRecord node;
    node.description = reference.description;
    node.content     = reference.content;
    Check(repo.CreateReference(*tx, node), "create reference");
    Relate(repo, *tx, plan.id, graph::RelationshipType::kHasReference, node.id);
    ++outcome.references;
  }

  tx->Commit();
  span.SetAttribute("trip.day_plans", static_cast<std::int64_t>(outcome.day_plans));
  return outcome;
}

} // namespace tripgraph::ingest
