#include "primitives/hash.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "util/hex.hpp"

namespace blockwire::primitives {

bool Hash256FromBytes(std::span<const std::uint8_t> bytes, Hash256* out) {
  if (bytes.size() != kHashSize) {
    return false;
  }
  std::copy(bytes.begin(), bytes.end(), out->begin());
  return true;
}

std::string Hash256ToString(const Hash256& hash) {
  return util::HexEncodeReversed(hash);
}

bool Hash256FromString(std::string_view hex, Hash256* out) {
  constexpr std::size_t kMaxHexLen = kHashSize * 2;
  if (hex.size() > kMaxHexLen) {
    return false;
  }
  std::string padded(kMaxHexLen - hex.size(), '0');
  padded.append(hex);
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(padded, &bytes)) {
    return false;
  }
  std::reverse(bytes.begin(), bytes.end());
  return Hash256FromBytes(bytes, out);
}

}  // namespace blockwire::primitives
