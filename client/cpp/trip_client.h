#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <google/protobuf/struct.pb.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tripgraph/services/v1/trip_query_service.grpc.pb.h"
#include "tripgraph/v1.hpp"

namespace tripgraph::client {

class TripClient {
 public:
  explicit TripClient(std::shared_ptr<::grpc::Channel> channel);

  arrow::Result<std::vector<tripgraph::v1::TripSummary>> LookupByOriginDestination(const std::string& origin,
                                                                                   const std::string& destination) const;

  arrow::Result<std::vector<tripgraph::v1::TripSummary>> LookupByOrigin(const std::string& origin) const;

  arrow::Result<tripgraph::v1::SearchResponse> Search(const std::string& origin, const std::optional<std::string>& destination) const;

  arrow::Result<tripgraph::v1::GraphStats> Stats() const;

 private:
  std::unique_ptr<tripgraph::v1::TripQueryService::Stub> stub_;
};

// field -> scalar record, the shape handed to prompt builders.
google::protobuf::Struct ToFlatRecord(const tripgraph::v1::TripSummary& summary);

// One JSON object per summary.
arrow::Result<std::string> ToFlatJson(const tripgraph::v1::TripSummary& summary);

} // namespace tripgraph::client
