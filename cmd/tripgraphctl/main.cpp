#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "client/cpp/trip_client.h"

using tripgraph::client::TripClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tripgraphctl <addr> lookup <origin> [destination]\n"
            << "  tripgraphctl <addr> search <origin> [destination]\n"
            << "  tripgraphctl <addr> stats\n";
}

static int PrintTrips(const std::vector<tripgraph::v1::TripSummary>& trips) {
  for (const auto& trip : trips) {
    auto json = tripgraph::client::ToFlatJson(trip);
    if (!json.ok()) {
      std::cerr << json.status().ToString() << "\n";
      return 2;
    }
    std::cout << *json << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr    = argv[1];
  const std::string command = argv[2];

  TripClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // --------------------------------------------------
  // lookup
  // --------------------------------------------------
  if (command == "lookup") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    auto trips = argc >= 5 ? client.LookupByOriginDestination(argv[3], argv[4]) : client.LookupByOrigin(argv[3]);
    if (!trips.ok()) {
      std::cerr << trips.status().ToString() << "\n";
      return 2;
    }
    return PrintTrips(*trips);
  }

  // --------------------------------------------------
  // search
  // --------------------------------------------------
  if (command == "search") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    std::optional<std::string> destination;
    if (argc >= 5) {
      destination = argv[4];
    }
    auto resp = client.Search(argv[3], destination);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return 2;
    }
    if (resp->broadened()) {
      std::cerr << "no trips for origin+destination; showing origin-only matches\n";
    }
    return PrintTrips({resp->trips().begin(), resp->trips().end()});
  }

  // --------------------------------------------------
  // stats
  // --------------------------------------------------
  if (command == "stats") {
    auto stats = client.Stats();
    if (!stats.ok()) {
      std::cerr << stats.status().ToString() << "\n";
      return 2;
    }
    std::string json;
    const auto  status = google::protobuf::util::MessageToJsonString(*stats, &json);
    if (!status.ok()) {
      std::cerr << status.message() << "\n";
      return 2;
    }
    std::cout << json << "\n";
    return 0;
  }

  Usage();
  return 1;
}
