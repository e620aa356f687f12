#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/query_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/trip_query_service.hpp"
#include "internal/util/errors.hpp"
#if TRIPGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if TRIPGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace tripgraph::factory {

namespace {

#if TRIPGRAPH_DB_SQLITE
std::shared_ptr<db::GraphRepository> BuildSqlite(const tripgraph::runtime::config::SqliteDatabaseConfig& config) {
  try {
    auto writer = std::make_shared<db::sqlite::SqliteDB>(config.path());
    db::sqlite::BootstrapSchema(*writer);

    // an in-memory database is private to its connection
    std::shared_ptr<db::sqlite::SqliteDB> reader;
    if (config.path() != ":memory:") {
      reader = std::make_shared<db::sqlite::SqliteDB>(config.path(), true);
    }
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(writer), std::move(reader));
  } catch (const db::sqlite::SqliteError& e) {
    throw util::SourceUnavailable("sqlite " + config.path() + ": " + e.what());
  }
}
#endif

#if TRIPGRAPH_DB_POSTGRES
std::shared_ptr<db::GraphRepository> BuildPostgres(const tripgraph::runtime::config::PostgresDatabaseConfig& config) {
  try {
    auto pool = std::make_shared<db::postgres::PgPool>(PostgresConnectionString(config), config.max_connections());
    db::postgres::BootstrapSchema(*pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
  } catch (const pqxx::broken_connection& e) {
    throw util::SourceUnavailable(std::string("postgres: ") + e.what());
  }
}
#endif

// libpq quoting: wrap in single quotes, escape ' and backslash
std::string QuoteConnValue(const std::string& value) {
  std::string quoted = "'";
  for (const char c : value) {
    if (c == '\'' || c == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(c);
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace

std::string PostgresConnectionString(const tripgraph::runtime::config::PostgresDatabaseConfig& config) {
  if (!config.connection_uri().empty()) {
    return config.connection_uri();
  }

  std::string conninfo = "host=" + QuoteConnValue(config.host());
  if (config.port() != 0) {
    conninfo += " port=" + std::to_string(config.port());
  }
  if (!config.database().empty()) {
    conninfo += " dbname=" + QuoteConnValue(config.database());
  }
  if (!config.user().empty()) {
    conninfo += " user=" + QuoteConnValue(config.user());
  }
  if (!config.password().empty()) {
    conninfo += " password=" + QuoteConnValue(config.password());
  }
  return conninfo;
}

std::shared_ptr<db::GraphRepository> BuildRepository(const tripgraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TRIPGRAPH_DB_SQLITE
    TRIPGRAPH_LOG_INFO("opening graph store", {observability::StringField("backend", "sqlite"),
                                               observability::StringField("path", database.sqlite().path())});
    return BuildSqlite(database.sqlite());
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TRIPGRAPH_DB_POSTGRES
    TRIPGRAPH_LOG_INFO("opening graph store", {observability::StringField("backend", "postgres"),
                                               observability::StringField("host", database.postgres().host())});
    return BuildPostgres(database.postgres());
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TRIPGRAPH_LOG_INFO("opening graph store", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

ingest::IngestOptions BuildIngestOptions(const tripgraph::runtime::config::RuntimeConfig& config) {
  ingest::IngestOptions options;
  if (config.ingest().workers() > 0) {
    options.workers = config.ingest().workers();
  }
  if (config.ingest().max_attempts() > 0) {
    options.max_attempts = config.ingest().max_attempts();
  }
  if (config.ingest().queue_capacity() > 0) {
    options.queue_capacity = config.ingest().queue_capacity();
  }
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const tripgraph::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);
  app.query      = std::make_shared<core::TripQuery>(app.repository);

  service::ServiceContext ctx;
  ctx.query = app.query;

  auto query_service = std::make_shared<service::TripQueryService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::QueryServer>(query_service));
  return app;
}

} // namespace tripgraph::factory
