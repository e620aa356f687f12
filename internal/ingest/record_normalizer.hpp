#pragma once

#include <google/protobuf/struct.pb.h>

#include "internal/ingest/normalized_trip.hpp"

namespace tripgraph::ingest {

/*
  Turns a raw dataset record into a NormalizedTrip.

  Total: every problem is recovered with the field default and listed in
  NormalizedTrip::issues. Nothing here throws for bad record content.
*/
NormalizedTrip Normalize(const google::protobuf::Struct& raw);

} // namespace tripgraph::ingest
