#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/trip_query.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/ingest_pipeline.hpp"

namespace tripgraph::factory {

/*
  Application

  Everything `tripgraph serve` keeps alive for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::GraphRepository>          repository;
  std::shared_ptr<core::TripQuery>              query;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The only place that knows concrete store types.

  Opens the configured backend and bootstraps its schema. Throws
  util::SourceUnavailable when the store cannot be reached and
  std::runtime_error for a backend this build does not include.
*/
std::shared_ptr<db::GraphRepository> BuildRepository(const tripgraph::runtime::config::RuntimeConfig& config);

// libpq keyword/value string from the discrete fields, or connection_uri verbatim.
std::string PostgresConnectionString(const tripgraph::runtime::config::PostgresDatabaseConfig& config);

ingest::IngestOptions BuildIngestOptions(const tripgraph::runtime::config::RuntimeConfig& config);

Application Build(const tripgraph::runtime::config::RuntimeConfig& config);

} // namespace tripgraph::factory
