#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/graph/schema.hpp"

namespace tripgraph::ingest {

// A field that was missing, mistyped or undecodable and fell back to its default.
struct MalformedField {
  std::string field;
  std::string reason;
};

struct NormalizedActivity {
  graph::ActivityKind kind      = graph::ActivityKind::kAttraction;
  graph::MealSlot     meal_slot = graph::MealSlot::kNone;
  std::string         value;
};

struct NormalizedDayPlan {
  std::optional<std::int64_t>     day;
  std::string                     current_city;
  std::vector<NormalizedActivity> activities;
};

struct NormalizedReference {
  std::string description;
  std::string content;
};

/*
  One dataset record, typed and defaulted.

  date, local_constraint, annotated_plan and reference_information keep the
  source text; day_plans and references are what decoding the last two
  produced.
*/
struct NormalizedTrip {
  std::string  org                  = "Unknown";
  std::string  dest                 = "Unknown";
  std::int64_t days                 = 0;
  std::int64_t visiting_city_number = 0;
  std::string  date                 = "[]";
  std::int64_t people_number        = 0;
  std::string  local_constraint     = "{}";
  double       budget               = 0.0;
  std::string  query;
  std::string  level                 = "unknown";
  std::string  annotated_plan        = "[]";
  std::string  reference_information = "[]";

  std::vector<NormalizedDayPlan>   day_plans;
  std::vector<NormalizedReference> references;

  std::vector<MalformedField> issues;
};

} // namespace tripgraph::ingest
