#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/trip_query_service.hpp"
#include "tripgraph/services/v1/trip_query_service.grpc.pb.h"

namespace tripgraph::grpc {

class QueryServer final : public tripgraph::services::v1::TripQueryService::Service {
 public:
  explicit QueryServer(std::shared_ptr<tripgraph::service::TripQueryService> svc);

  ::grpc::Status LookupByOriginDestination(::grpc::ServerContext*, const tripgraph::services::v1::LookupByOriginDestinationRequest*,
                                           tripgraph::services::v1::LookupResponse*) override;

  ::grpc::Status LookupByOrigin(::grpc::ServerContext*, const tripgraph::services::v1::LookupByOriginRequest*,
                                tripgraph::services::v1::LookupResponse*) override;

  ::grpc::Status Search(::grpc::ServerContext*, const tripgraph::services::v1::SearchRequest*, tripgraph::services::v1::SearchResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const tripgraph::services::v1::StatsRequest*, tripgraph::services::v1::StatsResponse*) override;

 private:
  std::shared_ptr<tripgraph::service::TripQueryService> service_;
};

} // namespace tripgraph::grpc
