#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tripgraph::graph {

/*
  Closed property-graph schema.

  Labels and relationship types are enumerated here and rendered through
  fixed lookup tables. Nothing in the store layer builds a schema name from
  record content.
*/

using NodeId = std::int64_t;

enum class NodeLabel {
  kCity,
  kTripPlan,
  kDayPlan,
  kTransportation,
  kMeal,
  kAttraction,
  kAccommodation,
  kReferenceInfo,
};

enum class RelationshipType {
  kOrigin,
  kDestination,
  kHasDayPlan,
  kInCity,
  kHasTransportation,
  kHasMeal,
  kHasAttraction,
  kHasAccommodation,
  kHasReference,
};

enum class ActivityKind {
  kTransportation,
  kMeal,
  kAttraction,
  kAccommodation,
};

// kNone for every activity kind except kMeal.
enum class MealSlot {
  kNone,
  kBreakfast,
  kLunch,
  kDinner,
};

inline constexpr std::array<NodeLabel, 8> kAllLabels = {
    NodeLabel::kCity,       NodeLabel::kTripPlan,      NodeLabel::kDayPlan,      NodeLabel::kTransportation,
    NodeLabel::kMeal,       NodeLabel::kAttraction,    NodeLabel::kAccommodation, NodeLabel::kReferenceInfo,
};

inline constexpr std::array<RelationshipType, 9> kAllRelationships = {
    RelationshipType::kOrigin,          RelationshipType::kDestination,       RelationshipType::kHasDayPlan,
    RelationshipType::kInCity,          RelationshipType::kHasTransportation, RelationshipType::kHasMeal,
    RelationshipType::kHasAttraction,   RelationshipType::kHasAccommodation,  RelationshipType::kHasReference,
};

std::string_view LabelName(NodeLabel label);
std::string_view RelationshipName(RelationshipType type);
std::string_view MealSlotName(MealSlot slot);

std::optional<NodeLabel>        ParseLabel(std::string_view name);
std::optional<RelationshipType> ParseRelationship(std::string_view name);
std::optional<MealSlot>         ParseMealSlot(std::string_view name);

NodeLabel                   LabelFor(ActivityKind kind);
RelationshipType            RelationshipFor(ActivityKind kind);
std::optional<ActivityKind> ActivityKindFor(NodeLabel label);

// True when (from)-[type]->(to) is part of the schema.
bool AllowsEndpoints(RelationshipType type, NodeLabel from, NodeLabel to);

} // namespace tripgraph::graph
