#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "primitives/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/clock.hpp"

namespace blockwire::primitives {

// Latest supported header format version. Not the peer protocol version.
constexpr std::uint32_t kBlockVersion = 2;

// Number of leading encoded bytes that feed the block identifier: version,
// both hashes, timestamp, bits and nonce. The transaction count that
// follows never contributes.
constexpr std::size_t kBlockHashLen = 80;

// version + timestamp + bits + nonce, the varint count and both hashes.
constexpr std::size_t kMaxBlockHeaderPayload =
    16 + serialize::kMaxVarIntPayload + (kHashSize * 2);

struct BlockHeader {
  std::uint32_t version{kBlockVersion};
  Hash256 previous_block_hash{};
  Hash256 merkle_root{};
  // Encoded as a uint32 count of seconds since the epoch, so sub-second
  // precision is dropped and dates after 2106 wrap.
  std::chrono::system_clock::time_point timestamp{};
  // Compact proof-of-work target.
  std::uint32_t bits{0};
  std::uint32_t nonce{0};
  // Transactions in the owning block. Must be 0 in a headers-only message.
  std::uint64_t txn_count{0};

  bool operator==(const BlockHeader& other) const = default;
};

// Builds a header for a new block with the current format version, the
// clock's current time and no transactions.
BlockHeader NewBlockHeader(const Hash256& previous_block_hash, const Hash256& merkle_root,
                           std::uint32_t bits, std::uint32_t nonce, const util::Clock& clock);

// Timestamp as it appears on the wire.
std::uint32_t HeaderTimestampSeconds(const BlockHeader& header);
std::chrono::system_clock::time_point TimestampFromSeconds(std::uint32_t seconds);

std::size_t HeaderSerializeSize(const BlockHeader& header);

bool IsHeadersOnlyCompatible(const BlockHeader& header);

}  // namespace blockwire::primitives
