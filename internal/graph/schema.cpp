#include "internal/graph/schema.hpp"

#include <cstddef>

namespace tripgraph::graph {

namespace {

constexpr std::array<std::string_view, kAllLabels.size()> kLabelNames = {
    "City", "TripPlan", "DayPlan", "Transportation", "Meal", "Attraction", "Accommodation", "ReferenceInfo",
};

constexpr std::array<std::string_view, kAllRelationships.size()> kRelationshipNames = {
    "ORIGIN",  "DESTINATION",    "HAS_DAY_PLAN",      "IN_CITY",       "HAS_TRANSPORTATION",
    "HAS_MEAL", "HAS_ATTRACTION", "HAS_ACCOMMODATION", "HAS_REFERENCE",
};

constexpr std::array<std::string_view, 4> kMealSlotNames = {"", "Breakfast", "Lunch", "Dinner"};

struct ActivityMapping {
  ActivityKind     kind;
  NodeLabel        label;
  RelationshipType relationship;
};

constexpr std::array<ActivityMapping, 4> kActivityMappings = {{
    {ActivityKind::kTransportation, NodeLabel::kTransportation, RelationshipType::kHasTransportation},
    {ActivityKind::kMeal, NodeLabel::kMeal, RelationshipType::kHasMeal},
    {ActivityKind::kAttraction, NodeLabel::kAttraction, RelationshipType::kHasAttraction},
    {ActivityKind::kAccommodation, NodeLabel::kAccommodation, RelationshipType::kHasAccommodation},
}};

struct Endpoints {
  RelationshipType type;
  NodeLabel        from;
  NodeLabel        to;
};

constexpr std::array<Endpoints, kAllRelationships.size()> kEndpoints = {{
    {RelationshipType::kOrigin, NodeLabel::kTripPlan, NodeLabel::kCity},
    {RelationshipType::kDestination, NodeLabel::kTripPlan, NodeLabel::kCity},
    {RelationshipType::kHasDayPlan, NodeLabel::kTripPlan, NodeLabel::kDayPlan},
    {RelationshipType::kInCity, NodeLabel::kDayPlan, NodeLabel::kCity},
    {RelationshipType::kHasTransportation, NodeLabel::kDayPlan, NodeLabel::kTransportation},
    {RelationshipType::kHasMeal, NodeLabel::kDayPlan, NodeLabel::kMeal},
    {RelationshipType::kHasAttraction, NodeLabel::kDayPlan, NodeLabel::kAttraction},
    {RelationshipType::kHasAccommodation, NodeLabel::kDayPlan, NodeLabel::kAccommodation},
    {RelationshipType::kHasReference, NodeLabel::kTripPlan, NodeLabel::kReferenceInfo},
}};

template <typename Enum, std::size_t N>
std::optional<Enum> FindByName(const std::array<std::string_view, N>& names, std::string_view name) {
  for (std::size_t i = 0; i < N; ++i) {
    if (names[i] == name) {
      return static_cast<Enum>(i);
    }
  }
  return std::nullopt;
}

const ActivityMapping& MappingFor(ActivityKind kind) {
  return kActivityMappings[static_cast<std::size_t>(kind)];
}

} // namespace

std::string_view LabelName(NodeLabel label) {
  return kLabelNames[static_cast<std::size_t>(label)];
}

std::string_view RelationshipName(RelationshipType type) {
  return kRelationshipNames[static_cast<std::size_t>(type)];
}

std::string_view MealSlotName(MealSlot slot) {
  return kMealSlotNames[static_cast<std::size_t>(slot)];
}

std::optional<NodeLabel> ParseLabel(std::string_view name) {
  return FindByName<NodeLabel>(kLabelNames, name);
}

std::optional<RelationshipType> ParseRelationship(std::string_view name) {
  return FindByName<RelationshipType>(kRelationshipNames, name);
}

std::optional<MealSlot> ParseMealSlot(std::string_view name) {
  return FindByName<MealSlot>(kMealSlotNames, name);
}

NodeLabel LabelFor(ActivityKind kind) {
  return MappingFor(kind).label;
}

RelationshipType RelationshipFor(ActivityKind kind) {
  return MappingFor(kind).relationship;
}

std::optional<ActivityKind> ActivityKindFor(NodeLabel label) {
  for (const auto& mapping : kActivityMappings) {
    if (mapping.label == label) {
      return mapping.kind;
    }
  }
  return std::nullopt;
}

bool AllowsEndpoints(RelationshipType type, NodeLabel from, NodeLabel to) {
  const auto& endpoints = kEndpoints[static_cast<std::size_t>(type)];
  return endpoints.from == from && endpoints.to == to;
}

} // namespace tripgraph::graph
