#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/dataset/source_factory.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/ingest_pipeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using tripgraph::runtime::Server;

static std::atomic<bool> g_stop{false};

void HandleSignal(int) {
  g_stop = true;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  tripgraph ingest --config <config.yaml>\n"
            << "  tripgraph serve --config <config.yaml>\n";
}

static void ShutdownObservability() {
  tripgraph::observability::ShutdownLogging();
  tripgraph::observability::ShutdownMetrics();
  tripgraph::observability::ShutdownTracing();
}

static void PrintReport(const tripgraph::ingest::IngestReport& report) {
  std::cout << "records_read=" << report.records_read << "\n"
            << "records_written=" << report.records_written << "\n"
            << "records_skipped=" << report.skipped.size() << "\n"
            << "malformed_fields=" << report.malformed_fields << "\n"
            << "cancelled=" << (report.cancelled ? "true" : "false") << "\n";
  for (const auto& skipped : report.skipped) {
    std::cout << "skipped index=" << skipped.index << " category=" << tripgraph::ingest::SkipCategoryName(skipped.category)
              << " reason=" << skipped.reason << "\n";
  }
}

static int RunIngest(const tripgraph::runtime::config::RuntimeConfig& config) {
  auto repository = tripgraph::factory::BuildRepository(config);
  auto source     = tripgraph::dataset::OpenSource(config.dataset());

  tripgraph::ingest::IngestPipeline pipeline(repository, tripgraph::factory::BuildIngestOptions(config));
  try {
    const auto report = pipeline.Run(*source, &g_stop);
    PrintReport(report);
    return 0;
  } catch (const tripgraph::ingest::IngestAborted& e) {
    TRIPGRAPH_LOG_ERROR("Ingest aborted", {tripgraph::observability::StringField("error", e.what())});
    std::cout << "aborted=true\n";
    PrintReport(e.Report());
    return 2;
  }
}

static int RunServe(const tripgraph::runtime::config::RuntimeConfig& config) {
  auto app = tripgraph::factory::Build(config);

  Server server(config.server().bind_address(), std::move(app.grpc_services));
  server.Start();
  TRIPGRAPH_LOG_INFO("tripgraph started", {tripgraph::observability::StringField("bind_address", config.server().bind_address())});

  while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  TRIPGRAPH_LOG_INFO("Shutting down tripgraph");
  server.Stop();
  return 0;
}

int main(int argc, char** argv) {
  if (argc != 4 || std::string(argv[2]) != "--config") {
    Usage();
    return 1;
  }
  const std::string command     = argv[1];
  const std::string config_path = argv[3];
  if (command != "ingest" && command != "serve") {
    Usage();
    return 1;
  }

  // Register signal handlers before any long-running work.
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  try {
    auto config = tripgraph::config::ConfigLoader::LoadFromYaml(config_path);

    tripgraph::observability::InitializeTracing(config);
    tripgraph::observability::InitializeMetrics(config);
    tripgraph::observability::InitializeLogging(config);

    const int rc = command == "ingest" ? RunIngest(config) : RunServe(config);
    ShutdownObservability();
    return rc;
  } catch (const std::exception& e) {
    TRIPGRAPH_LOG_ERROR("Fatal error", {tripgraph::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }
}
