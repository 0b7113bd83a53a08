#include "primitives/block.hpp"

namespace blockwire::primitives {

BlockHeader NewBlockHeader(const Hash256& previous_block_hash, const Hash256& merkle_root,
                           std::uint32_t bits, std::uint32_t nonce, const util::Clock& clock) {
  BlockHeader header;
  header.version = kBlockVersion;
  header.previous_block_hash = previous_block_hash;
  header.merkle_root = merkle_root;
  header.timestamp = clock.Now();
  header.bits = bits;
  header.nonce = nonce;
  header.txn_count = 0;
  return header;
}

std::uint32_t HeaderTimestampSeconds(const BlockHeader& header) {
  const auto seconds =
      std::chrono::floor<std::chrono::seconds>(header.timestamp.time_since_epoch()).count();
  return static_cast<std::uint32_t>(seconds);
}

std::chrono::system_clock::time_point TimestampFromSeconds(std::uint32_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

std::size_t HeaderSerializeSize(const BlockHeader& header) {
  return kBlockHashLen + serialize::VarIntSerializeSize(header.txn_count);
}

bool IsHeadersOnlyCompatible(const BlockHeader& header) { return header.txn_count == 0; }

}  // namespace blockwire::primitives
