#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/trip_client.h"

int main(int argc, char** argv) {
  const std::string target      = argc > 1 ? argv[1] : "localhost:50051";
  const std::string origin      = argc > 2 ? argv[2] : "New York";
  const std::string destination = argc > 3 ? argv[3] : "Chicago";

  tripgraph::client::TripClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Search falls back to origin-only matches when the pair has none.
  auto result = client.Search(origin, destination);
  if (!result.ok()) {
    std::cerr << "Search RPC failed: " << result.status().ToString() << '\n';
    return 1;
  }

  const auto& response = result.ValueOrDie();
  std::cout << response.trips_size() << " trip(s) from " << origin << (response.broadened() ? "" : " to " + destination) << '\n';
  for (const auto& trip : response.trips()) {
    std::cout << "  " << trip.org() << " -> " << trip.dest() << ", " << trip.days() << " days, budget " << trip.budget() << ", level "
              << trip.level() << '\n';
  }
  return 0;
}
