#pragma once

#include "pg_pool.hpp"

namespace tripgraph::db::postgres {

// Same layout as the sqlite backend: node table, property tables, relationship table.
void BootstrapSchema(PgPool& pool);

} // namespace tripgraph::db::postgres
