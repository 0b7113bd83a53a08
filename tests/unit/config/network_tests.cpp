#include <cstdlib>
#include <iostream>

#include "config/network.hpp"

int main() {
  using namespace blockwire::config;

  if (GetNetworkConfig().type != NetworkType::kMainnet) {
    std::cerr << "network_tests: mainnet should be selected by default\n";
    return EXIT_FAILURE;
  }

  const auto regtest = NetworkFromString("reg");
  if (!regtest || *regtest != NetworkType::kRegtest) {
    std::cerr << "network_tests: 'reg' alias not recognised\n";
    return EXIT_FAILURE;
  }
  if (NetworkFromString("signet").has_value()) {
    std::cerr << "network_tests: unknown network accepted\n";
    return EXIT_FAILURE;
  }

  SelectNetwork(NetworkType::kTestnet);
  const auto& cfg = GetNetworkConfig();
  if (cfg.network_id != "testnet" || NetworkName(cfg.type) != "testnet" ||
      cfg.default_port != 18333 || cfg.message_start[0] != 0x0B) {
    std::cerr << "network_tests: testnet configuration mismatch\n";
    return EXIT_FAILURE;
  }
  if (cfg.protocol_version != kProtocolVersion) {
    std::cerr << "network_tests: unexpected protocol version\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
