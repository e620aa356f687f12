#pragma once

#include <cstdint>
#include <string>

#include "internal/graph/schema.hpp"

namespace tripgraph::db::model {

/*
  TripPlan node. Immutable after creation.

  date, local_constraint, annotated_plan and reference_information keep the
  raw encoded text of the source record.
*/
struct TripPlanRecord {
  graph::NodeId id = 0;
  std::string   org;
  std::string   dest;
  std::int64_t  days                 = 0;
  std::int64_t  visiting_city_number = 0;
  std::string   date;
  std::int64_t  people_number = 0;
  std::string   local_constraint;
  double        budget = 0.0;
  std::string   query;
  std::string   level;
  std::string   annotated_plan;
  std::string   reference_information;
};

} // namespace tripgraph::db::model
