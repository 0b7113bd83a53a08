#include "consensus/block_hash.hpp"

#include <span>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/block_codec.hpp"

namespace blockwire::consensus {

primitives::CodecStatus ComputeBlockHash(const primitives::BlockHeader& header,
                                         std::uint32_t pver, primitives::Hash256* out) {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(primitives::kMaxBlockHeaderPayload);
  primitives::VectorSink sink(&buffer);
  const auto status = primitives::WriteBlockHeader(&sink, pver, header);
  if (status != primitives::CodecStatus::kOk) {
    return status;
  }
  if (buffer.size() < primitives::kBlockHashLen) {
    return primitives::CodecStatus::kInvariantViolation;
  }

  const auto digest = crypto::DoubleSha256(
      std::span<const std::uint8_t>(buffer.data(), primitives::kBlockHashLen));
  primitives::Hash256 hash{};
  if (!primitives::Hash256FromBytes(digest, &hash)) {
    return primitives::CodecStatus::kInvariantViolation;
  }
  *out = hash;
  return primitives::CodecStatus::kOk;
}

}  // namespace blockwire::consensus
