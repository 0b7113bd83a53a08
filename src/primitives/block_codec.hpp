#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "primitives/block.hpp"
#include "primitives/status.hpp"
#include "primitives/stream.hpp"

namespace blockwire::primitives {

// Writes the header in wire order: version, previous block hash, Merkle
// root, timestamp seconds, bits, nonce, then the transaction count as a
// varint. On failure the sink holds a partial header and must be
// discarded.
CodecStatus WriteBlockHeader(ByteSink* sink, std::uint32_t pver, const BlockHeader& header);

// Reads a header written by WriteBlockHeader. `header` is only assigned on
// success.
CodecStatus ReadBlockHeader(ByteSource* source, std::uint32_t pver, BlockHeader* header);

// Appends the encoding to `out`.
CodecStatus SerializeBlockHeader(const BlockHeader& header, std::uint32_t pver,
                                 std::vector<std::uint8_t>* out);
// Decodes starting at `*offset`; advances it past the header on success.
CodecStatus DeserializeBlockHeader(const std::vector<std::uint8_t>& data, std::size_t* offset,
                                   std::uint32_t pver, BlockHeader* header);

}  // namespace blockwire::primitives
