#pragma once

#include <string>

#include "internal/graph/schema.hpp"

namespace tripgraph::db::model {

struct CityRecord {
  graph::NodeId id = 0;
  std::string   name;
};

} // namespace tripgraph::db::model
