#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace blockwire::config {

enum class NetworkType {
  kMainnet,
  kTestnet,
  kRegtest,
};

// Peer protocol version understood by this codec. Passed to every
// encode/decode call; no revision so far changes the header encoding.
constexpr std::uint32_t kProtocolVersion = 70001;

struct NetworkConfig {
  NetworkType type{NetworkType::kMainnet};
  std::string network_id{"mainnet"};
  std::array<std::uint8_t, 4> message_start{{0xF9, 0xBE, 0xB4, 0xD9}};
  std::uint32_t protocol_version{kProtocolVersion};
  std::uint16_t default_port{8333};
};

const NetworkConfig& GetNetworkConfig();
void SelectNetwork(NetworkType type);
std::optional<NetworkType> NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

}  // namespace blockwire::config
