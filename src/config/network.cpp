#include "config/network.hpp"

#include <utility>

namespace blockwire::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::array<std::uint8_t, 4> magic,
                          std::uint16_t port) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.message_start = magic;
  cfg.protocol_version = kProtocolVersion;
  cfg.default_port = port;
  return cfg;
}

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig mainnet =
      BuildConfig(NetworkType::kMainnet, "mainnet", {0xF9, 0xBE, 0xB4, 0xD9}, 8333);
  static const NetworkConfig testnet =
      BuildConfig(NetworkType::kTestnet, "testnet", {0x0B, 0x11, 0x09, 0x07}, 18333);
  static const NetworkConfig regtest =
      BuildConfig(NetworkType::kRegtest, "regtest", {0xFA, 0xBF, 0xB5, 0xDA}, 18444);
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kRegtest:
      return regtest;
  }
  return mainnet;
}

NetworkConfig g_network_config = ConfigFor(NetworkType::kMainnet);

}  // namespace

const NetworkConfig& GetNetworkConfig() { return g_network_config; }

void SelectNetwork(NetworkType type) { g_network_config = ConfigFor(type); }

std::optional<NetworkType> NetworkFromString(std::string_view name) {
  if (name == "mainnet" || name == "main") return NetworkType::kMainnet;
  if (name == "testnet" || name == "test") return NetworkType::kTestnet;
  if (name == "regtest" || name == "reg") return NetworkType::kRegtest;
  return std::nullopt;
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kRegtest:
      return "regtest";
  }
  return "mainnet";
}

}  // namespace blockwire::config
