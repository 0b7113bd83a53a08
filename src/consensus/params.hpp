#pragma once

#include <cstdint>
#include <string>

#include "config/network.hpp"
#include "primitives/block.hpp"
#include "primitives/hash.hpp"

namespace blockwire::consensus {

struct ChainParams {
  config::NetworkType network{config::NetworkType::kMainnet};
  std::string network_id;
  std::uint32_t genesis_bits{0};
  std::uint32_t genesis_time{0};
  std::uint32_t genesis_nonce{0};
  primitives::BlockHeader genesis_header;
  // Derived from genesis_header through ComputeBlockHash.
  primitives::Hash256 genesis_hash{};
};

const ChainParams& Params(config::NetworkType type);

}  // namespace blockwire::consensus
