#pragma once

#include "internal/graph/schema.hpp"

namespace tripgraph::db::model {

struct RelationshipRecord {
  graph::NodeId           from_id = 0;
  graph::RelationshipType type    = graph::RelationshipType::kOrigin;
  graph::NodeId           to_id   = 0;
};

} // namespace tripgraph::db::model
