#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace tripgraph::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS node (id INTEGER PRIMARY KEY AUTOINCREMENT, label TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS node_label ON node(label);",
      "CREATE TABLE IF NOT EXISTS city (id INTEGER PRIMARY KEY REFERENCES node(id), name TEXT NOT NULL UNIQUE);",
      "CREATE TABLE IF NOT EXISTS trip_plan (id INTEGER PRIMARY KEY REFERENCES node(id), org TEXT NOT NULL, dest TEXT NOT NULL, "
      "org_key TEXT NOT NULL, dest_key TEXT NOT NULL, days INTEGER NOT NULL, visiting_city_number INTEGER NOT NULL, date TEXT NOT NULL, "
      "people_number INTEGER NOT NULL, local_constraint TEXT NOT NULL, budget REAL NOT NULL, query TEXT NOT NULL, level TEXT NOT NULL, "
      "annotated_plan TEXT NOT NULL, reference_information TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS trip_plan_org_dest ON trip_plan(org_key, dest_key);",
      "CREATE TABLE IF NOT EXISTS day_plan (id INTEGER PRIMARY KEY REFERENCES node(id), day INTEGER, current_city TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS activity (id INTEGER PRIMARY KEY REFERENCES node(id), kind INTEGER NOT NULL, value TEXT NOT NULL, meal_type TEXT);",
      "CREATE TABLE IF NOT EXISTS reference_info (id INTEGER PRIMARY KEY REFERENCES node(id), description TEXT NOT NULL, content TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS relationship (from_id INTEGER NOT NULL REFERENCES node(id), type TEXT NOT NULL, "
      "to_id INTEGER NOT NULL REFERENCES node(id), PRIMARY KEY (from_id, type, to_id)) WITHOUT ROWID;",
      "CREATE INDEX IF NOT EXISTS relationship_type ON relationship(type);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace tripgraph::db::sqlite
