#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/graph/schema.hpp"

namespace {

using namespace tripgraph::graph;

void TestNamesRoundTripThroughLookupTables() {
  std::set<std::string> seen;
  for (const auto label : kAllLabels) {
    const auto name = LabelName(label);
    assert(!name.empty());
    assert(seen.insert(std::string(name)).second);
    assert(ParseLabel(name) == label);
  }
  for (const auto type : kAllRelationships) {
    const auto name = RelationshipName(type);
    assert(seen.insert(std::string(name)).second);
    assert(ParseRelationship(name) == type);
  }

  assert(LabelName(NodeLabel::kReferenceInfo) == "ReferenceInfo");
  assert(RelationshipName(RelationshipType::kHasDayPlan) == "HAS_DAY_PLAN");
  assert(MealSlotName(MealSlot::kBreakfast) == "Breakfast");
}

void TestRecordContentNeverNamesSchemaElements() {
  assert(!ParseLabel("City) DETACH DELETE (n"));
  assert(!ParseLabel("city"));
  assert(!ParseRelationship("HAS_SHOPPING"));
  assert(!ParseRelationship(""));
  assert(!ParseMealSlot("Brunch"));
}

void TestActivityKindsMapToLabelAndRelationship() {
  assert(LabelFor(ActivityKind::kMeal) == NodeLabel::kMeal);
  assert(RelationshipFor(ActivityKind::kMeal) == RelationshipType::kHasMeal);
  assert(RelationshipFor(ActivityKind::kAccommodation) == RelationshipType::kHasAccommodation);
  assert(ActivityKindFor(NodeLabel::kTransportation) == ActivityKind::kTransportation);
  assert(!ActivityKindFor(NodeLabel::kCity));
  assert(!ActivityKindFor(NodeLabel::kDayPlan));
}

void TestEndpointRules() {
  assert(AllowsEndpoints(RelationshipType::kOrigin, NodeLabel::kTripPlan, NodeLabel::kCity));
  assert(AllowsEndpoints(RelationshipType::kInCity, NodeLabel::kDayPlan, NodeLabel::kCity));
  assert(!AllowsEndpoints(RelationshipType::kInCity, NodeLabel::kTripPlan, NodeLabel::kCity));
  assert(!AllowsEndpoints(RelationshipType::kHasMeal, NodeLabel::kDayPlan, NodeLabel::kAttraction));
  assert(!AllowsEndpoints(RelationshipType::kHasReference, NodeLabel::kCity, NodeLabel::kReferenceInfo));
}

} // namespace

int main() {
  TestNamesRoundTripThroughLookupTables();
  TestRecordContentNeverNamesSchemaElements();
  TestActivityKindsMapToLabelAndRelationship();
  TestEndpointRules();

  std::cout << "tripgraph_unit_graph_schema: pass\n";
  return 0;
}
