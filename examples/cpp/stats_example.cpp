#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/trip_client.h"

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  tripgraph::client::TripClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  auto result = client.Stats();
  if (!result.ok()) {
    std::cerr << "Stats RPC failed: " << result.status().ToString() << '\n';
    return 1;
  }

  const auto& stats = result.ValueOrDie();
  std::cout << "tripgraph stats for " << target << '\n';
  for (const auto& [label, count] : stats.nodes()) {
    std::cout << "  (:" << label << ") " << count << '\n';
  }
  for (const auto& [type, count] : stats.relationships()) {
    std::cout << "  [:" << type << "] " << count << '\n';
  }
  return 0;
}
