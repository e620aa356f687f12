#include "pg_schema.hpp"

namespace tripgraph::db::postgres {

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS node (id BIGSERIAL PRIMARY KEY, label TEXT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS node_label ON node(label);");
  tx.exec("CREATE TABLE IF NOT EXISTS city (id BIGINT PRIMARY KEY REFERENCES node(id), name TEXT NOT NULL UNIQUE);");
  tx.exec("CREATE TABLE IF NOT EXISTS trip_plan (id BIGINT PRIMARY KEY REFERENCES node(id), org TEXT NOT NULL, dest TEXT NOT NULL, "
          "org_key TEXT NOT NULL, dest_key TEXT NOT NULL, days BIGINT NOT NULL, visiting_city_number BIGINT NOT NULL, date TEXT NOT NULL, "
          "people_number BIGINT NOT NULL, local_constraint TEXT NOT NULL, budget DOUBLE PRECISION NOT NULL, query TEXT NOT NULL, "
          "level TEXT NOT NULL, annotated_plan TEXT NOT NULL, reference_information TEXT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS trip_plan_org_dest ON trip_plan(org_key, dest_key);");
  tx.exec("CREATE TABLE IF NOT EXISTS day_plan (id BIGINT PRIMARY KEY REFERENCES node(id), day BIGINT, current_city TEXT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS activity (id BIGINT PRIMARY KEY REFERENCES node(id), kind SMALLINT NOT NULL, value TEXT NOT NULL, meal_type TEXT);");
  tx.exec("CREATE TABLE IF NOT EXISTS reference_info (id BIGINT PRIMARY KEY REFERENCES node(id), description TEXT NOT NULL, content TEXT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS relationship (from_id BIGINT NOT NULL REFERENCES node(id), type TEXT NOT NULL, "
          "to_id BIGINT NOT NULL REFERENCES node(id), PRIMARY KEY (from_id, type, to_id));");
  tx.exec("CREATE INDEX IF NOT EXISTS relationship_type ON relationship(type);");
  tx.commit();
}

} // namespace tripgraph::db::postgres
