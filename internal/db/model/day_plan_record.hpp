#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/graph/schema.hpp"

namespace tripgraph::db::model {

struct DayPlanRecord {
  graph::NodeId               id = 0;
  std::optional<std::int64_t> day;
  std::string                 current_city;
};

} // namespace tripgraph::db::model
