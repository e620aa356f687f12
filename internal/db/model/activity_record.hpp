#pragma once

#include <string>

#include "internal/graph/schema.hpp"

namespace tripgraph::db::model {

// One node per present activity field; never deduplicated.
struct ActivityRecord {
  graph::NodeId       id   = 0;
  graph::ActivityKind kind = graph::ActivityKind::kAttraction;
  std::string         value;
  graph::MealSlot     meal_slot = graph::MealSlot::kNone;
};

} // namespace tripgraph::db::model
