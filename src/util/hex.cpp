#include "util/hex.hpp"

namespace blockwire::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

void AppendByte(std::string* out, std::uint8_t byte) {
  out->push_back(kHexDigits[(byte >> 4) & 0x0F]);
  out->push_back(kHexDigits[byte & 0x0F]);
}

int FromHexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (const auto byte : data) {
    AppendByte(&out, byte);
  }
  return out;
}

std::string HexEncodeReversed(std::span<const std::uint8_t> data) {
  std::string out;
  out.reserve(data.size() * 2);
  for (auto it = data.rbegin(); it != data.rend(); ++it) {
    AppendByte(&out, *it);
  }
  return out;
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  out->clear();
  if (hex.size() % 2 != 0) {
    return false;
  }
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = FromHexDigit(hex[i]);
    const int lo = FromHexDigit(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out->clear();
      return false;
    }
    out->push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

}  // namespace blockwire::util
