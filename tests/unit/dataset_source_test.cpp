#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/dataset/csv_source.hpp"
#include "internal/dataset/json_lines_source.hpp"
#include "internal/dataset/memory_source.hpp"
#include "internal/dataset/source_factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using tripgraph::dataset::RecordSource;

std::filesystem::path WriteFile(const std::string& name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "tripgraph_dataset_source_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / name;
  std::ofstream out(file_path, std::ios::binary);
  out << content;
  out.close();
  return file_path;
}

struct Drained {
  std::vector<google::protobuf::Struct> records;
  std::vector<std::string>              malformed;
};

Drained Drain(RecordSource& source) {
  Drained out;
  while (true) {
    try {
      auto record = source.Next();
      if (!record) break;
      out.records.push_back(std::move(*record));
    } catch (const tripgraph::util::RecordMalformed& e) {
      out.malformed.push_back(e.what());
    }
  }
  return out;
}

std::string Text(const google::protobuf::Struct& record, const std::string& key) {
  return record.fields().at(key).string_value();
}

void TestJsonLinesSkipsBlankLinesAndReportsBadOnes() {
  const auto path = WriteFile("trips.jsonl", "{\"org\": \"New York\", \"dest\": \"Chicago\", \"days\": 3}\n"
                                             "\n"
                                             "   \n"
                                             "{\"org\": \"Seattle\", \"dest\": \n"
                                             "[1, 2]\n"
                                             "{\"org\": \"Boston\", \"budget\": null}\n");

  tripgraph::dataset::JsonLinesSource source(path);
  auto drained = Drain(source);
  assert(drained.records.size() == 2);
  assert(Text(drained.records[0], "org") == "New York");
  assert(drained.records[0].fields().at("days").number_value() == 3);
  assert(Text(drained.records[1], "org") == "Boston");
  assert(drained.malformed.size() == 2);
  assert(drained.malformed[0].find(":4:") != std::string::npos);
  assert(drained.malformed[1].find(":5:") != std::string::npos);

  source.Reset();
  assert(Drain(source).records.size() == 2);
  assert(source.Describe() == "jsonl:" + path.string());
}

void TestMissingFileIsUnavailable() {
  bool thrown = false;
  try {
    tripgraph::dataset::JsonLinesSource source("/nonexistent/trips.jsonl");
  } catch (const tripgraph::util::SourceUnavailable&) {
    thrown = true;
  }
  assert(thrown);

  tripgraph::runtime::config::DatasetConfig config;
  config.set_path("/nonexistent/trips.csv");
  thrown = false;
  try {
    tripgraph::dataset::OpenSource(config);
  } catch (const tripgraph::util::SourceUnavailable&) {
    thrown = true;
  }
  assert(thrown);
}

void TestOpenSourceRequiresPath() {
  tripgraph::runtime::config::DatasetConfig config;
  bool                                      thrown = false;
  try {
    tripgraph::dataset::OpenSource(config);
  } catch (const tripgraph::util::InvalidArgument&) {
    thrown = true;
  }
  assert(thrown);
}

void TestOpenSourceHonorsLimit() {
  const auto path = WriteFile("limited.jsonl", "{\"org\": \"A\"}\n{\"org\": \"B\"}\n{\"org\": \"C\"}\n");

  tripgraph::runtime::config::DatasetConfig config;
  config.set_path(path.string());
  config.set_limit(2);

  auto source = tripgraph::dataset::OpenSource(config);
  auto drained = Drain(*source);
  assert(drained.records.size() == 2);
  assert(Text(drained.records[1], "org") == "B");
  assert(source->Describe() == "jsonl:" + path.string() + " limit=2");
}

void TestLimitCountsUnreadableRecords() {
  const auto path = WriteFile("limited_bad.jsonl", "{\"org\": \"A\"}\nnot json\n{\"org\": \"C\"}\n");

  tripgraph::dataset::LimitedSource source(std::make_unique<tripgraph::dataset::JsonLinesSource>(path), 2);
  auto drained = Drain(source);
  assert(drained.records.size() == 1);
  assert(drained.malformed.size() == 1);

  source.Reset();
  assert(Drain(source).records.size() == 1);
}

void TestInMemorySource() {
  std::vector<google::protobuf::Struct> records(3);
  (*records[2].mutable_fields())["org"].set_string_value("Denver");

  tripgraph::dataset::InMemorySource source(records);
  auto drained = Drain(source);
  assert(drained.records.size() == 3);
  assert(Text(drained.records[2], "org") == "Denver");
  assert(!source.Next());

  source.Reset();
  assert(source.Next().has_value());
}

void TestCsvWithIndexColumnAndMultilineCells() {
  const auto path = WriteFile("trips.CSV", ",org,dest,days,budget,annotated_plan\n"
                                           "0,New York,Chicago,3,1900,\"[{'days': 1,\n 'current_city': 'New York'}]\"\n"
                                           "1,Seattle,Boston,2,,\"[]\"\n"
                                           "2,too,few\n"
                                           "3,Denver,Austin,1,500,\"[]\"\n");

  tripgraph::runtime::config::DatasetConfig config;
  config.set_path(path.string());
  auto source = tripgraph::dataset::OpenSource(config);
  assert(source->Describe() == "csv:" + path.string());

  auto drained = Drain(*source);
  assert(drained.records.size() == 3);
  assert(drained.malformed.size() == 1);

  const auto& first = drained.records[0];
  assert(first.fields().count("") == 0);
  assert(Text(first, "org") == "New York");
  // known columns arrive as text, the normalizer coerces them
  assert(Text(first, "days") == "3");
  assert(Text(first, "annotated_plan") == "[{'days': 1,\n 'current_city': 'New York'}]");
  assert(Text(drained.records[1], "budget").empty());
  assert(Text(drained.records[2], "dest") == "Austin");
}

void TestCsvCellWithInvalidUtf8SkipsOnlyThatRecord() {
  const auto path = WriteFile("bad_bytes.csv", "org,dest,days\n"
                                               "New York,Chicago,3\n"
                                               "Seattle,Bost\xff\xfeon,2\n"
                                               "Denver,Austin,1\n");

  tripgraph::dataset::CsvSource source(path);
  auto drained = Drain(source);
  assert(drained.records.size() == 2);
  assert(drained.malformed.size() == 1);
  assert(drained.malformed[0].find("record 2") != std::string::npos);
  assert(drained.malformed[0].find("'dest'") != std::string::npos);
  assert(Text(drained.records[0], "org") == "New York");
  assert(Text(drained.records[1], "org") == "Denver");
}

} // namespace

int main() {
  TestJsonLinesSkipsBlankLinesAndReportsBadOnes();
  TestMissingFileIsUnavailable();
  TestOpenSourceRequiresPath();
  TestOpenSourceHonorsLimit();
  TestLimitCountsUnreadableRecords();
  TestInMemorySource();
  TestCsvWithIndexColumnAndMultilineCells();
  TestCsvCellWithInvalidUtf8SkipsOnlyThatRecord();

  std::cout << "tripgraph_unit_dataset_source: pass\n";
  return 0;
}
