#include "pg_pool.hpp"

namespace tripgraph::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    // dropped by the server while idle; open a replacement in its slot
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("find_city", "SELECT id, name FROM city WHERE name=$1");

  conn.prepare("insert_node", "INSERT INTO node(label) VALUES($1) RETURNING id");

  conn.prepare("delete_node", "DELETE FROM node WHERE id=$1");

  conn.prepare("insert_city", "INSERT INTO city(id,name) VALUES($1,$2) ON CONFLICT(name) DO NOTHING RETURNING id");

  conn.prepare("insert_trip_plan",
               "INSERT INTO trip_plan(id,org,dest,org_key,dest_key,days,visiting_city_number,date,people_number,"
               "local_constraint,budget,query,level,annotated_plan,reference_information) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15)");

  conn.prepare("insert_day_plan", "INSERT INTO day_plan(id,day,current_city) VALUES($1,$2,$3)");

  conn.prepare("insert_activity", "INSERT INTO activity(id,kind,value,meal_type) VALUES($1,$2,$3,$4)");

  conn.prepare("insert_reference", "INSERT INTO reference_info(id,description,content) VALUES($1,$2,$3)");

  conn.prepare("node_label", "SELECT label FROM node WHERE id=$1");

  conn.prepare("insert_relationship", "INSERT INTO relationship(from_id,type,to_id) VALUES($1,$2,$3) ON CONFLICT DO NOTHING");

  conn.prepare("outgoing", "SELECT to_id FROM relationship WHERE from_id=$1 AND type=$2 ORDER BY to_id");

  conn.prepare("count_nodes", "SELECT COUNT(*) FROM node WHERE label=$1");

  conn.prepare("count_relationships", "SELECT COUNT(*) FROM relationship WHERE type=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace tripgraph::db::postgres
