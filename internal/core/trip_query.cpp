#include "trip_query.hpp"

#include "internal/graph/schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace tripgraph::core {

TripQuery::TripQuery(std::shared_ptr<db::GraphRepository> repository) : repository_(std::move(repository)) {
}

std::vector<db::model::TripPlanRecord> TripQuery::Find(const db::TripPlanFilter& filter) {
  auto tx    = repository_->BeginReadOnly();
  auto trips = repository_->FindTripPlans(*tx, filter);
  tx->Commit();
  return trips;
}

std::vector<db::model::TripPlanRecord> TripQuery::LookupByOriginDestination(const std::string& origin, const std::string& destination) {
  return Find({.origin = origin, .destination = destination});
}

std::vector<db::model::TripPlanRecord> TripQuery::LookupByOrigin(const std::string& origin) {
  return Find({.origin = origin, .destination = std::nullopt});
}

SearchResult TripQuery::Search(const std::string& origin, const std::optional<std::string>& destination) {
  if (util::Trim(origin).empty()) {
    throw util::InvalidArgument("origin is required");
  }

  SearchResult result;
  if (destination && !util::Trim(*destination).empty()) {
    result.trips = LookupByOriginDestination(origin, *destination);
    if (!result.trips.empty()) {
      return result;
    }
    result.broadened = true;
  }
  result.trips = LookupByOrigin(origin);
  return result;
}

GraphStatistics TripQuery::Stats() {
  GraphStatistics stats;
  auto            tx = repository_->BeginReadOnly();
  for (const auto label : graph::kAllLabels) {
    stats.nodes[std::string(graph::LabelName(label))] = repository_->CountNodes(*tx, label);
  }
  for (const auto type : graph::kAllRelationships) {
    stats.relationships[std::string(graph::RelationshipName(type))] = repository_->CountRelationships(*tx, type);
  }
  tx->Commit();
  return stats;
}

} // namespace tripgraph::core
