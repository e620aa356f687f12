#pragma once

#include "service_context.hpp"
#include "tripgraph/services/v1/trip_query_service.pb.h"

namespace tripgraph::db::model {
struct TripPlanRecord;
}

namespace tripgraph::service {

// TripPlan -> wire summary. Day plans and activities are not expanded.
tripgraph::graph::v1::TripSummary ToSummary(const tripgraph::db::model::TripPlanRecord& record);

class TripQueryService {
 public:
  explicit TripQueryService(ServiceContext ctx);

  tripgraph::services::v1::LookupResponse LookupByOriginDestination(const tripgraph::services::v1::LookupByOriginDestinationRequest& req);
  tripgraph::services::v1::LookupResponse LookupByOrigin(const tripgraph::services::v1::LookupByOriginRequest& req);
  tripgraph::services::v1::SearchResponse Search(const tripgraph::services::v1::SearchRequest& req);
  tripgraph::services::v1::StatsResponse  Stats(const tripgraph::services::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace tripgraph::service
