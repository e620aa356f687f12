#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/trip_plan_record.hpp"

namespace tripgraph::core {

struct SearchResult {
  std::vector<db::model::TripPlanRecord> trips;
  // true when the origin+destination lookup was empty and the origin-only
  // lookup answered instead
  bool broadened = false;
};

struct GraphStatistics {
  std::map<std::string, std::uint64_t> nodes;
  std::map<std::string, std::uint64_t> relationships;
};

/*
  TripQuery

  Read side of the graph. Every call runs in its own read-only transaction
  and sees one committed snapshot.

  Lookups match the org/dest attributes stored on TripPlan, ASCII
  case-insensitively, in ingestion order. No match is an empty result.
*/
class TripQuery {
 public:
  explicit TripQuery(std::shared_ptr<db::GraphRepository> repository);

  std::vector<db::model::TripPlanRecord> LookupByOriginDestination(const std::string& origin, const std::string& destination);
  std::vector<db::model::TripPlanRecord> LookupByOrigin(const std::string& origin);

  // Throws util::InvalidArgument for an empty origin.
  SearchResult Search(const std::string& origin, const std::optional<std::string>& destination);

  GraphStatistics Stats();

 private:
  std::vector<db::model::TripPlanRecord> Find(const db::TripPlanFilter& filter);

  std::shared_ptr<db::GraphRepository> repository_;
};

} // namespace tripgraph::core
