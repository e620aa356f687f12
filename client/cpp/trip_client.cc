#include "client/cpp/trip_client.h"

#include <google/protobuf/util/json_util.h>
#include <grpcpp/client_context.h>

#include <string_view>

namespace tripgraph::client {

namespace {

arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

std::vector<tripgraph::v1::TripSummary> Summaries(const tripgraph::v1::LookupResponse& response) {
  return {response.trips().begin(), response.trips().end()};
}

} // namespace

TripClient::TripClient(std::shared_ptr<::grpc::Channel> channel) : stub_(tripgraph::v1::TripQueryService::NewStub(channel)) {
}

arrow::Result<std::vector<tripgraph::v1::TripSummary>> TripClient::LookupByOriginDestination(const std::string& origin,
                                                                                             const std::string& destination) const {
  tripgraph::v1::LookupByOriginDestinationRequest request;
  request.set_origin(origin);
  request.set_destination(destination);

  tripgraph::v1::LookupResponse response;
  ::grpc::ClientContext           ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->LookupByOriginDestination(&ctx, request, &response), "LookupByOriginDestination"));
  return Summaries(response);
}

arrow::Result<std::vector<tripgraph::v1::TripSummary>> TripClient::LookupByOrigin(const std::string& origin) const {
  tripgraph::v1::LookupByOriginRequest request;
  request.set_origin(origin);

  tripgraph::v1::LookupResponse response;
  ::grpc::ClientContext           ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->LookupByOrigin(&ctx, request, &response), "LookupByOrigin"));
  return Summaries(response);
}

arrow::Result<tripgraph::v1::SearchResponse> TripClient::Search(const std::string& origin, const std::optional<std::string>& destination) const {
  tripgraph::v1::SearchRequest request;
  request.set_origin(origin);
  if (destination) {
    request.set_destination(*destination);
  }

  tripgraph::v1::SearchResponse response;
  ::grpc::ClientContext           ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Search(&ctx, request, &response), "Search"));
  return response;
}

arrow::Result<tripgraph::v1::GraphStats> TripClient::Stats() const {
  tripgraph::v1::StatsResponse response;
  ::grpc::ClientContext          ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Stats(&ctx, tripgraph::v1::StatsRequest{}, &response), "Stats"));
  return response.stats();
}

google::protobuf::Struct ToFlatRecord(const tripgraph::v1::TripSummary& summary) {
  google::protobuf::Struct record;
  auto&                    fields = *record.mutable_fields();
  fields["org"].set_string_value(summary.org());
  fields["dest"].set_string_value(summary.dest());
  fields["days"].set_number_value(static_cast<double>(summary.days()));
  fields["date"].set_string_value(summary.date());
  fields["people_number"].set_number_value(static_cast<double>(summary.people_number()));
  fields["budget"].set_number_value(summary.budget());
  fields["query_text"].set_string_value(summary.query_text());
  fields["level"].set_string_value(summary.level());
  fields["annotated_plan"].set_string_value(summary.annotated_plan());
  fields["reference_information"].set_string_value(summary.reference_information());
  return record;
}

arrow::Result<std::string> ToFlatJson(const tripgraph::v1::TripSummary& summary) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(ToFlatRecord(summary), &json);
  if (!status.ok()) {
    return arrow::Status::SerializationError("flat record: ", std::string(status.message()));
  }
  return json;
}

} // namespace tripgraph::client
