#pragma once

#include <cstddef>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/ingest/normalized_trip.hpp"

namespace tripgraph::ingest {

struct WriteOutcome {
  graph::NodeId trip_plan_id = 0;
  std::size_t   day_plans    = 0;
  std::size_t   activities   = 0;
  std::size_t   references   = 0;
};

/*
  GraphWriter

  Maps one NormalizedTrip onto the graph inside a single write transaction:

    1. merge origin and destination City
    2. create TripPlan
    3. ORIGIN / DESTINATION
    4. per day: DayPlan, HAS_DAY_PLAN, IN_CITY, one node per activity
    5. per reference: ReferenceInfo, HAS_REFERENCE

  Either all of it commits or none of it is visible.

  Throws:
    util::WriteConflict      a step failed; the transaction was rolled back
    util::SourceUnavailable  the store could not be reached
*/
class GraphWriter {
 public:
  explicit GraphWriter(std::shared_ptr<db::GraphRepository> repository);

  WriteOutcome Write(const NormalizedTrip& trip);

 private:
  std::shared_ptr<db::GraphRepository> repository_;
};

} // namespace tripgraph::ingest
