#pragma once

#include <cstddef>
#include <cstdint>

#include "primitives/hash.hpp"
#include "primitives/status.hpp"
#include "primitives/stream.hpp"

namespace blockwire::primitives::serialize {

// Largest encoded varint: 0xFF marker followed by a uint64.
constexpr std::size_t kMaxVarIntPayload = 9;

// Fixed-width integers are little-endian on the wire.
CodecStatus WriteUint32(ByteSink* sink, std::uint32_t value);
CodecStatus WriteUint64(ByteSink* sink, std::uint64_t value);
CodecStatus WriteHash(ByteSink* sink, const Hash256& hash);
CodecStatus ReadUint32(ByteSource* source, std::uint32_t* value);
CodecStatus ReadUint64(ByteSource* source, std::uint64_t* value);
CodecStatus ReadHash(ByteSource* source, Hash256* hash);

// Compact-size varint: values below 0xFD take one byte, larger ones a
// 0xFD/0xFE/0xFF marker followed by a 2/4/8-byte integer. `pver` is the
// peer protocol version; every version defined so far encodes the same
// way.
CodecStatus WriteVarInt(ByteSink* sink, std::uint32_t pver, std::uint64_t value);
// Rejects encodings that use a wider form than the value needs.
CodecStatus ReadVarInt(ByteSource* source, std::uint32_t pver, std::uint64_t* value);
std::size_t VarIntSerializeSize(std::uint64_t value);

}  // namespace blockwire::primitives::serialize
