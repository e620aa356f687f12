#include "trip_query_service.hpp"

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/core/trip_query.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "tripgraph/v1.hpp"

namespace tripgraph::service {

using namespace tripgraph::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view origin, Fn&& fn) {
  observability::SpanScope span(route);
  span.SetAttribute("trip.origin", origin);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TRIPGRAPH_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("origin", origin),
                                       observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

template <typename Response>
void AppendSummaries(const std::vector<db::model::TripPlanRecord>& trips, Response& resp) {
  resp.mutable_trips()->Reserve(static_cast<int>(trips.size()));
  for (const auto& trip : trips) {
    *resp.add_trips() = ToSummary(trip);
  }
}

} // namespace

TripSummary ToSummary(const db::model::TripPlanRecord& record) {
  TripSummary summary;
  summary.set_org(record.org);
  summary.set_dest(record.dest);
  summary.set_days(record.days);
  summary.set_date(record.date);
  summary.set_people_number(record.people_number);
  summary.set_budget(record.budget);
  summary.set_query_text(record.query);
  summary.set_level(record.level);
  summary.set_annotated_plan(record.annotated_plan);
  summary.set_reference_information(record.reference_information);
  return summary;
}

TripQueryService::TripQueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

LookupResponse TripQueryService::LookupByOriginDestination(const LookupByOriginDestinationRequest& req) {
  return ObserveRpc("TripQueryService.LookupByOriginDestination", req.origin(), [&] {
    LookupResponse resp;
    AppendSummaries(ctx_.query->LookupByOriginDestination(req.origin(), req.destination()), resp);
    return resp;
  });
}

LookupResponse TripQueryService::LookupByOrigin(const LookupByOriginRequest& req) {
  return ObserveRpc("TripQueryService.LookupByOrigin", req.origin(), [&] {
    LookupResponse resp;
    AppendSummaries(ctx_.query->LookupByOrigin(req.origin()), resp);
    return resp;
  });
}

SearchResponse TripQueryService::Search(const SearchRequest& req) {
  return ObserveRpc("TripQueryService.Search", req.origin(), [&] {
    std::optional<std::string> destination;
    if (!req.destination().empty()) {
      destination = req.destination();
    }

    const auto     result = ctx_.query->Search(req.origin(), destination);
    SearchResponse resp;
    AppendSummaries(result.trips, resp);
    resp.set_broadened(result.broadened);
    return resp;
  });
}

StatsResponse TripQueryService::Stats(const StatsRequest&) {
  return ObserveRpc("TripQueryService.Stats", "", [&] {
    const auto    stats = ctx_.query->Stats();
    StatsResponse resp;
    auto*         out = resp.mutable_stats();
    for (const auto& [label, count] : stats.nodes) {
      (*out->mutable_nodes())[label] = count;
    }
    for (const auto& [type, count] : stats.relationships) {
      (*out->mutable_relationships())[type] = count;
    }
    return resp;
  });
}

} // namespace tripgraph::service
