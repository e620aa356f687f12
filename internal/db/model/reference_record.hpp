#pragma once

#include <string>

#include "internal/graph/schema.hpp"

namespace tripgraph::db::model {

struct ReferenceRecord {
  graph::NodeId id = 0;
  std::string   description;
  std::string   content;
};

} // namespace tripgraph::db::model
