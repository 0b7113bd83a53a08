#include "primitives/serialize.hpp"

#include <array>

namespace blockwire::primitives::serialize {

namespace {

CodecStatus FromReadStatus(ReadStatus status, CodecStatus on_end) {
  switch (status) {
    case ReadStatus::kOk:
      return CodecStatus::kOk;
    case ReadStatus::kEndOfStream:
      return on_end;
    case ReadStatus::kError:
      return CodecStatus::kStreamFailure;
  }
  return CodecStatus::kStreamFailure;
}

CodecStatus WriteBytes(ByteSink* sink, std::span<const std::uint8_t> data) {
  return sink->Write(data) ? CodecStatus::kOk : CodecStatus::kStreamFailure;
}

template <std::size_t N>
void EncodeLE(std::uint64_t value, std::array<std::uint8_t, N>* out) {
  for (std::size_t i = 0; i < N; ++i) {
    (*out)[i] = static_cast<std::uint8_t>((value >> (i * 8)) & 0xFFu);
  }
}

template <std::size_t N>
std::uint64_t DecodeLE(const std::array<std::uint8_t, N>& in) {
  std::uint64_t result = 0;
  for (std::size_t i = 0; i < N; ++i) {
    result |= static_cast<std::uint64_t>(in[i]) << (8 * i);
  }
  return result;
}

// Reads an N-byte little-endian integer. A short read maps to `on_end`
// so callers can tell a missing fixed field from a cut-off varint.
template <std::size_t N>
CodecStatus ReadLE(ByteSource* source, CodecStatus on_end, std::uint64_t* value) {
  std::array<std::uint8_t, N> buf{};
  const auto status = FromReadStatus(source->Read(buf), on_end);
  if (status != CodecStatus::kOk) return status;
  *value = DecodeLE(buf);
  return CodecStatus::kOk;
}

}  // namespace

CodecStatus WriteUint32(ByteSink* sink, std::uint32_t value) {
  std::array<std::uint8_t, 4> buf{};
  EncodeLE(value, &buf);
  return WriteBytes(sink, buf);
}

CodecStatus WriteUint64(ByteSink* sink, std::uint64_t value) {
  std::array<std::uint8_t, 8> buf{};
  EncodeLE(value, &buf);
  return WriteBytes(sink, buf);
}

CodecStatus WriteHash(ByteSink* sink, const Hash256& hash) { return WriteBytes(sink, hash); }

CodecStatus ReadUint32(ByteSource* source, std::uint32_t* value) {
  std::uint64_t tmp = 0;
  const auto status = ReadLE<4>(source, CodecStatus::kTruncatedInput, &tmp);
  if (status != CodecStatus::kOk) return status;
  *value = static_cast<std::uint32_t>(tmp);
  return CodecStatus::kOk;
}

CodecStatus ReadUint64(ByteSource* source, std::uint64_t* value) {
  return ReadLE<8>(source, CodecStatus::kTruncatedInput, value);
}

CodecStatus ReadHash(ByteSource* source, Hash256* hash) {
  Hash256 tmp{};
  const auto status = FromReadStatus(source->Read(tmp), CodecStatus::kTruncatedInput);
  if (status != CodecStatus::kOk) return status;
  *hash = tmp;
  return CodecStatus::kOk;
}

CodecStatus WriteVarInt(ByteSink* sink, std::uint32_t /*pver*/, std::uint64_t value) {
  if (value < 0xFD) {
    const std::array<std::uint8_t, 1> buf{static_cast<std::uint8_t>(value)};
    return WriteBytes(sink, buf);
  }
  if (value <= 0xFFFF) {
    std::array<std::uint8_t, 3> buf{0xFD};
    buf[1] = static_cast<std::uint8_t>(value & 0xFFu);
    buf[2] = static_cast<std::uint8_t>((value >> 8) & 0xFFu);
    return WriteBytes(sink, buf);
  }
  const std::array<std::uint8_t, 1> marker{
      static_cast<std::uint8_t>(value <= 0xFFFFFFFFULL ? 0xFE : 0xFF)};
  const auto status = WriteBytes(sink, marker);
  if (status != CodecStatus::kOk) return status;
  if (marker[0] == 0xFE) {
    return WriteUint32(sink, static_cast<std::uint32_t>(value));
  }
  return WriteUint64(sink, value);
}

CodecStatus ReadVarInt(ByteSource* source, std::uint32_t /*pver*/, std::uint64_t* value) {
  std::array<std::uint8_t, 1> prefix{};
  auto status = FromReadStatus(source->Read(prefix), CodecStatus::kTruncatedInput);
  if (status != CodecStatus::kOk) return status;

  std::uint64_t result = 0;
  std::uint64_t min_value = 0;
  switch (prefix[0]) {
    case 0xFD:
      status = ReadLE<2>(source, CodecStatus::kMalformedVarInt, &result);
      min_value = 0xFD;
      break;
    case 0xFE:
      status = ReadLE<4>(source, CodecStatus::kMalformedVarInt, &result);
      min_value = 0x10000;
      break;
    case 0xFF:
      status = ReadLE<8>(source, CodecStatus::kMalformedVarInt, &result);
      min_value = 0x100000000ULL;
      break;
    default:
      *value = prefix[0];
      return CodecStatus::kOk;
  }
  if (status != CodecStatus::kOk) return status;
  if (result < min_value) {
    return CodecStatus::kMalformedVarInt;
  }
  *value = result;
  return CodecStatus::kOk;
}

std::size_t VarIntSerializeSize(std::uint64_t value) {
  if (value < 0xFD) return 1;
  if (value <= 0xFFFF) return 3;
  if (value <= 0xFFFFFFFFULL) return 5;
  return kMaxVarIntPayload;
}

}  // namespace blockwire::primitives::serialize
