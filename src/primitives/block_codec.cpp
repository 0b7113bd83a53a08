#include "primitives/block_codec.hpp"

#include "primitives/serialize.hpp"

namespace blockwire::primitives {

CodecStatus WriteBlockHeader(ByteSink* sink, std::uint32_t pver, const BlockHeader& header) {
  auto status = serialize::WriteUint32(sink, header.version);
  if (status == CodecStatus::kOk) status = serialize::WriteHash(sink, header.previous_block_hash);
  if (status == CodecStatus::kOk) status = serialize::WriteHash(sink, header.merkle_root);
  if (status == CodecStatus::kOk) {
    status = serialize::WriteUint32(sink, HeaderTimestampSeconds(header));
  }
  if (status == CodecStatus::kOk) status = serialize::WriteUint32(sink, header.bits);
  if (status == CodecStatus::kOk) status = serialize::WriteUint32(sink, header.nonce);
  if (status != CodecStatus::kOk) return status;
  return serialize::WriteVarInt(sink, pver, header.txn_count);
}

CodecStatus ReadBlockHeader(ByteSource* source, std::uint32_t pver, BlockHeader* header) {
  BlockHeader decoded;
  std::uint32_t seconds = 0;
  auto status = serialize::ReadUint32(source, &decoded.version);
  if (status == CodecStatus::kOk) {
    status = serialize::ReadHash(source, &decoded.previous_block_hash);
  }
  if (status == CodecStatus::kOk) status = serialize::ReadHash(source, &decoded.merkle_root);
  if (status == CodecStatus::kOk) status = serialize::ReadUint32(source, &seconds);
  if (status == CodecStatus::kOk) status = serialize::ReadUint32(source, &decoded.bits);
  if (status == CodecStatus::kOk) status = serialize::ReadUint32(source, &decoded.nonce);
  if (status != CodecStatus::kOk) return status;
  decoded.timestamp = TimestampFromSeconds(seconds);

  status = serialize::ReadVarInt(source, pver, &decoded.txn_count);
  if (status != CodecStatus::kOk) return status;
  *header = decoded;
  return CodecStatus::kOk;
}

CodecStatus SerializeBlockHeader(const BlockHeader& header, std::uint32_t pver,
                                 std::vector<std::uint8_t>* out) {
  out->reserve(out->size() + HeaderSerializeSize(header));
  VectorSink sink(out);
  return WriteBlockHeader(&sink, pver, header);
}

CodecStatus DeserializeBlockHeader(const std::vector<std::uint8_t>& data, std::size_t* offset,
                                   std::uint32_t pver, BlockHeader* header) {
  BufferSource source(data, *offset);
  const auto status = ReadBlockHeader(&source, pver, header);
  if (status == CodecStatus::kOk) {
    *offset = source.Offset();
  }
  return status;
}

}  // namespace blockwire::primitives
