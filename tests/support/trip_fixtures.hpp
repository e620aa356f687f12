#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

namespace tripgraph::testing {

inline google::protobuf::Struct MakeRecord(const std::string& org, const std::string& dest, double days, const std::string& annotated_plan,
                                           const std::string& reference_information) {
  google::protobuf::Struct record;
  auto&                    fields = *record.mutable_fields();
  fields["org"].set_string_value(org);
  fields["dest"].set_string_value(dest);
  fields["days"].set_number_value(days);
  fields["visiting_city_number"].set_number_value(1);
  fields["date"].set_string_value("['2022-03-16', '2022-03-17', '2022-03-18']");
  fields["people_number"].set_number_value(1);
  fields["local_constraint"].set_string_value("{'house rule': None, 'cuisine': None, 'room type': None, 'transportation': None}");
  fields["budget"].set_number_value(1900);
  fields["query"].set_string_value("Please plan a trip from " + org + " to " + dest + ".");
  fields["level"].set_string_value("easy");
  fields["annotated_plan"].set_string_value(annotated_plan);
  fields["reference_information"].set_string_value(reference_information);
  return record;
}

// The New York -> Chicago record: breakfast on day 1, one attraction on day 2, one reference.
inline google::protobuf::Struct NewYorkToChicago() {
  return MakeRecord("New York", "Chicago", 3,
                    "[{'days': 1, 'current_city': 'New York', 'transportation': '-', 'breakfast': 'Hotel buffet', "
                    "'attraction': '-', 'lunch': '-', 'dinner': '', 'accommodation': '-'}, "
                    "{'days': 2, 'current_city': 'Chicago', 'transportation': '-', 'breakfast': '-', "
                    "'attraction': 'Millennium Park', 'lunch': '-', 'dinner': '-', 'accommodation': '-'}]",
                    "[{'Description': 'Visa', 'Content': 'Not required'}]");
}

} // namespace tripgraph::testing
