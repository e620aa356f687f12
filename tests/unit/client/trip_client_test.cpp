#include "client/cpp/trip_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <iostream>
#include <string>

namespace {

using tripgraph::client::TripClient;

tripgraph::v1::TripSummary MakeSummary() {
  tripgraph::v1::TripSummary summary;
  summary.set_org("New York");
  summary.set_dest("Chicago");
  summary.set_days(3);
  summary.set_date("['2022-03-16']");
  summary.set_people_number(2);
  summary.set_budget(1900.5);
  summary.set_query_text("Plan a trip.");
  summary.set_level("easy");
  summary.set_annotated_plan("[{'days': 1}]");
  summary.set_reference_information("[]");
  return summary;
}

void TestFlatRecordCarriesEveryField() {
  const auto record = tripgraph::client::ToFlatRecord(MakeSummary());
  const auto& fields = record.fields();
  assert(fields.size() == 10);
  assert(fields.at("org").string_value() == "New York");
  assert(fields.at("dest").string_value() == "Chicago");
  assert(fields.at("days").number_value() == 3);
  assert(fields.at("people_number").number_value() == 2);
  assert(fields.at("budget").number_value() == 1900.5);
  assert(fields.at("query_text").string_value() == "Plan a trip.");
  assert(fields.at("annotated_plan").string_value() == "[{'days': 1}]");
}

void TestFlatJson() {
  const auto json = tripgraph::client::ToFlatJson(MakeSummary());
  assert(json.ok());
  assert(json->front() == '{');
  assert(json->find("\"org\":\"New York\"") != std::string::npos);
  assert(json->find("\"budget\":1900.5") != std::string::npos);
}

void TestUnreachableServerIsIOError() {
  // nothing listens on port 1
  TripClient client(grpc::CreateChannel("127.0.0.1:1", grpc::InsecureChannelCredentials()));
  const auto result = client.Stats();
  assert(!result.ok());
  assert(result.status().IsIOError());
}

} // namespace

int main() {
  TestFlatRecordCarriesEveryField();
  TestFlatJson();
  TestUnreachableServerIsIOError();

  std::cout << "tripgraph_unit_trip_client: pass\n";
  return 0;
}
