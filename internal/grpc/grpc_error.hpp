#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace tripgraph::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace tripgraph::grpc
