#include <cstdint>
#include <iostream>
#include <vector>

#include "primitives/serialize.hpp"
#include "primitives/stream.hpp"

namespace {

using namespace blockwire::primitives;

constexpr std::uint32_t kPver = 70001;

bool ExpectEq(const std::vector<std::uint8_t>& actual, const std::vector<std::uint8_t>& expected,
              const char* label) {
  if (actual != expected) {
    std::cerr << label << ": mismatch (size " << actual.size() << " vs " << expected.size()
              << ")\n";
    return false;
  }
  return true;
}

std::vector<std::uint8_t> Encode(std::uint64_t value) {
  std::vector<std::uint8_t> out;
  VectorSink sink(&out);
  if (serialize::WriteVarInt(&sink, kPver, value) != CodecStatus::kOk) {
    out.clear();
  }
  return out;
}

CodecStatus Decode(const std::vector<std::uint8_t>& data, std::uint64_t* value,
                   std::size_t* consumed = nullptr) {
  BufferSource source(data);
  const auto status = serialize::ReadVarInt(&source, kPver, value);
  if (consumed) *consumed = source.Offset();
  return status;
}

}  // namespace

int main() {
  if (!ExpectEq(Encode(0), {0x00}, "encode 0")) return 1;
  if (!ExpectEq(Encode(0xFC), {0xFC}, "encode 0xFC")) return 1;
  if (!ExpectEq(Encode(0xFD), {0xFD, 0xFD, 0x00}, "encode 0xFD")) return 1;
  if (!ExpectEq(Encode(300), {0xFD, 0x2C, 0x01}, "encode 300")) return 1;
  if (!ExpectEq(Encode(0x10000), {0xFE, 0x00, 0x00, 0x01, 0x00}, "encode 0x10000")) return 1;
  if (!ExpectEq(Encode(100000), {0xFE, 0xA0, 0x86, 0x01, 0x00}, "encode 100000")) return 1;
  if (!ExpectEq(Encode(0x100000000ULL),
                {0xFF, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00}, "encode 2^32")) {
    return 1;
  }

  const std::uint64_t boundaries[] = {0, 0xFC, 0xFD, 0xFFFF, 0x10000, 0xFFFFFFFFULL,
                                      0x100000000ULL, 0xFFFFFFFFFFFFFFFFULL};
  for (const auto value : boundaries) {
    const auto encoded = Encode(value);
    if (encoded.size() != serialize::VarIntSerializeSize(value)) {
      std::cerr << "size mismatch for " << value << "\n";
      return 1;
    }
    std::uint64_t decoded = 0;
    std::size_t consumed = 0;
    if (Decode(encoded, &decoded, &consumed) != CodecStatus::kOk || decoded != value ||
        consumed != encoded.size()) {
      std::cerr << "decode failed for " << value << "\n";
      return 1;
    }
  }

  // Non-canonical encodings should be rejected.
  {
    std::uint64_t value = 0;
    if (Decode({0xFD, 0xFC, 0x00}, &value) != CodecStatus::kMalformedVarInt) {
      std::cerr << "non-canonical 0xFC accepted\n";
      return 1;
    }
    if (Decode({0xFE, 0xFF, 0xFF, 0x00, 0x00}, &value) != CodecStatus::kMalformedVarInt) {
      std::cerr << "non-canonical 0xFFFF accepted\n";
      return 1;
    }
    if (Decode({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00}, &value) !=
        CodecStatus::kMalformedVarInt) {
      std::cerr << "non-canonical 0xFFFFFFFF accepted\n";
      return 1;
    }
  }

  // A marker byte without its payload is malformed; no byte at all is
  // plain truncation.
  {
    std::uint64_t value = 0;
    if (Decode({0xFD}, &value) != CodecStatus::kMalformedVarInt) {
      std::cerr << "bare 0xFD marker not reported as malformed\n";
      return 1;
    }
    if (Decode({0xFF, 0x01, 0x02}, &value) != CodecStatus::kMalformedVarInt) {
      std::cerr << "short 0xFF payload not reported as malformed\n";
      return 1;
    }
    if (Decode({}, &value) != CodecStatus::kTruncatedInput) {
      std::cerr << "empty input not reported as truncated\n";
      return 1;
    }
  }

  return 0;
}
