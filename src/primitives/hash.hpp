#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace blockwire::primitives {

constexpr std::size_t kHashSize = 32;

// Raw bytes are kept in wire order. Human-readable strings use the
// reversed (display) order.
using Hash256 = std::array<std::uint8_t, kHashSize>;

// Copies `bytes` into `out`. Fails without touching `out` unless the slice
// is exactly kHashSize bytes long.
bool Hash256FromBytes(std::span<const std::uint8_t> bytes, Hash256* out);

// Display form: byte-reversed lowercase hex.
std::string Hash256ToString(const Hash256& hash);

// Parses a display-form string. Strings shorter than 64 characters are
// treated as having their leading zeros dropped.
bool Hash256FromString(std::string_view hex, Hash256* out);

}  // namespace blockwire::primitives
