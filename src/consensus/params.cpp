#include "consensus/params.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "consensus/block_hash.hpp"

namespace blockwire::consensus {

namespace {

// All three networks share the genesis coinbase, hence the Merkle root.
constexpr const char* kGenesisMerkleRoot =
    "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

primitives::BlockHeader CreateGenesisHeader(std::uint32_t timestamp, std::uint32_t nonce,
                                            std::uint32_t bits) {
  primitives::BlockHeader header;
  header.version = 1;
  header.previous_block_hash.fill(0);
  if (!primitives::Hash256FromString(kGenesisMerkleRoot, &header.merkle_root)) {
    throw std::runtime_error("invalid genesis merkle root literal");
  }
  header.timestamp = primitives::TimestampFromSeconds(timestamp);
  header.bits = bits;
  header.nonce = nonce;
  header.txn_count = 1;
  return header;
}

ChainParams BuildParams(config::NetworkType network, std::string network_id, std::uint32_t bits,
                        std::uint32_t timestamp, std::uint32_t nonce) {
  ChainParams params{};
  params.network = network;
  params.network_id = std::move(network_id);
  params.genesis_bits = bits;
  params.genesis_time = timestamp;
  params.genesis_nonce = nonce;
  params.genesis_header = CreateGenesisHeader(timestamp, nonce, bits);
  const auto status = ComputeBlockHash(params.genesis_header, config::kProtocolVersion,
                                       &params.genesis_hash);
  if (status != primitives::CodecStatus::kOk) {
    throw std::runtime_error("failed to hash genesis header: " +
                             std::string(primitives::CodecStatusName(status)));
  }
  return params;
}

}  // namespace

const ChainParams& Params(config::NetworkType type) {
  static const ChainParams mainnet =
      BuildParams(config::NetworkType::kMainnet, "mainnet", 0x1d00ffff, 1231006505, 2083236893);
  static const ChainParams testnet =
      BuildParams(config::NetworkType::kTestnet, "testnet", 0x1d00ffff, 1296688602, 414098458);
  // Regtest uses the easiest possible target so blocks can be mined instantly.
  static const ChainParams regtest =
      BuildParams(config::NetworkType::kRegtest, "regtest", 0x207fffff, 1296688602, 2);
  switch (type) {
    case config::NetworkType::kMainnet:
      return mainnet;
    case config::NetworkType::kTestnet:
      return testnet;
    case config::NetworkType::kRegtest:
      return regtest;
  }
  return mainnet;
}

}  // namespace blockwire::consensus
