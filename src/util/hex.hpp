#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blockwire::util {

std::string HexEncode(std::span<const std::uint8_t> data);
// Encodes the bytes last-to-first, the display order for hashes.
std::string HexEncodeReversed(std::span<const std::uint8_t> data);
// Accepts upper and lower case digits. On failure `out` is left empty.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

}  // namespace blockwire::util
