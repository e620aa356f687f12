#pragma once

#include "sqlite_db.hpp"

namespace tripgraph::db::sqlite {

/*
  Relational emulation of the graph.

    node          one row per node, shared id space for every label
    city, ...     one property table per label, keyed by node id
    relationship  (from_id, type, to_id), unique per triple

  Safe to run on every start.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace tripgraph::db::sqlite
