#pragma once

#include <cstdint>

#include "primitives/block.hpp"
#include "primitives/hash.hpp"
#include "primitives/status.hpp"

namespace blockwire::consensus {

// Block identifier: double SHA-256 of the first kBlockHashLen encoded
// bytes. The transaction count is outside that prefix, so headers that
// differ only in txn_count share an identifier.
primitives::CodecStatus ComputeBlockHash(const primitives::BlockHeader& header,
                                         std::uint32_t pver, primitives::Hash256* out);

}  // namespace blockwire::consensus
