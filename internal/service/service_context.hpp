#pragma once

#include <memory>

namespace tripgraph::core {
class TripQuery;
}

namespace tripgraph::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tripgraph::core::TripQuery> query;
};

} // namespace tripgraph::service
