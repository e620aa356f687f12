#include "query_server.hpp"

#include "grpc_error.hpp"

namespace tripgraph::grpc {

using namespace tripgraph::services::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

QueryServer::QueryServer(std::shared_ptr<tripgraph::service::TripQueryService> svc) : service_(std::move(svc)) {
}

::grpc::Status QueryServer::LookupByOriginDestination(::grpc::ServerContext*, const LookupByOriginDestinationRequest* req,
                                                      LookupResponse* resp) {
  return Handle([&] { *resp = service_->LookupByOriginDestination(*req); });
}

::grpc::Status QueryServer::LookupByOrigin(::grpc::ServerContext*, const LookupByOriginRequest* req, LookupResponse* resp) {
  return Handle([&] { *resp = service_->LookupByOrigin(*req); });
}

::grpc::Status QueryServer::Search(::grpc::ServerContext*, const SearchRequest* req, SearchResponse* resp) {
  return Handle([&] { *resp = service_->Search(*req); });
}

::grpc::Status QueryServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Handle([&] { *resp = service_->Stats(*req); });
}

} // namespace tripgraph::grpc
