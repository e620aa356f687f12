#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using tripgraph::config::ConfigLoader;
using tripgraph::runtime::config::DatasetFormat;
using tripgraph::runtime::config::OtlpTransport;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "tripgraph_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "127.0.0.1:0"
database:
  sqlite:
    path: "C:\\trips\\\"quoted\"\\graph.sqlite"
dataset:
  path: "/data/travel planner.jsonl"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\trips\\\"quoted\"\\graph.sqlite");
  assert(config.dataset().path() == "/data/travel planner.jsonl");
  assert(config.server().bind_address() == "127.0.0.1:0");
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  postgres:
    host: db
    user: trips
    password: "5432"
    port: 6543
)");
  assert(config.database().postgres().password() == "5432");
  assert(config.database().postgres().port() == 6543);
  assert(config.database().postgres().max_connections() == 8);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)"));
  assert(Rejects(R"(ingest:
  workerz: 4
)"));
}

void TestDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_memory());
  assert(config.ingest().workers() == 1);
  assert(config.ingest().max_attempts() == 3);
  assert(config.ingest().queue_capacity() == 64);
  assert(config.dataset().limit() == 0);

  auto bare_memory = ConfigLoader::LoadFromString("database:\n  memory:\n");
  assert(bare_memory.database().has_memory());
}

void TestEnumShorthand() {
  auto config = ConfigLoader::LoadFromString(R"(dataset:
  path: trips.txt
  format: csv
  limit: 10
observability:
  transport: http
  otlp_endpoint: "http://collector:4318"
)");
  assert(config.dataset().format() == DatasetFormat::DATASET_FORMAT_CSV);
  assert(config.dataset().limit() == 10);
  assert(config.observability().transport() == OtlpTransport::OTLP_TRANSPORT_HTTP);

  auto full = ConfigLoader::LoadFromString("dataset:\n  format: DATASET_FORMAT_JSONL\n");
  assert(full.dataset().format() == DatasetFormat::DATASET_FORMAT_JSONL);

  assert(Rejects("dataset:\n  format: parquet\n"));
}

void TestPasswordFromEnvironment() {
  setenv("TRIPGRAPH_DB_PASSWORD", "from-env", 1);
  auto config = ConfigLoader::LoadFromString(R"(database:
  postgres:
    host: db
    password: from-file
)");
  unsetenv("TRIPGRAPH_DB_PASSWORD");
  assert(config.database().postgres().password() == "from-env");
  assert(config.database().postgres().port() == 5432);
}

void TestValidation() {
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("database:\n  postgres:\n    user: trips\n"));
  assert(Rejects("ingest:\n  workers: 8\n  queue_capacity: 4\n"));
  assert(Rejects("- just\n- a list\n"));
  assert(Rejects("server: [unclosed\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/tripgraph.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "missing config file must be fatal");
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestDefaults();
  TestEnumShorthand();
  TestPasswordFromEnvironment();
  TestValidation();

  std::cout << "tripgraph_unit_config_loader: pass\n";
  return 0;
}
