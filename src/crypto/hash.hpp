#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace blockwire::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;

// Standard FIPS-180-4 SHA-256.
Sha256Hash Sha256(std::span<const std::uint8_t> data);

// SHA-256 applied to its own output. This is the digest used for block
// identifiers.
Sha256Hash DoubleSha256(std::span<const std::uint8_t> data);

}  // namespace blockwire::crypto
