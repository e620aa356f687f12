#pragma once

#include "tripgraph/graph/v1/trip.pb.h"

#include "tripgraph/services/v1/trip_query_service.pb.h"
#include "tripgraph/services/v1/trip_query_service.grpc.pb.h"

namespace tripgraph::v1 {
using namespace ::tripgraph::graph::v1;
using namespace ::tripgraph::services::v1;
}
