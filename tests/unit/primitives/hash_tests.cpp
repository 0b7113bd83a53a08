#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "primitives/hash.hpp"

int main() {
  using namespace blockwire::primitives;

  std::vector<std::uint8_t> bytes(kHashSize);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<std::uint8_t>(i);
  }

  Hash256 hash{};
  if (!Hash256FromBytes(bytes, &hash) || hash[0] != 0x00 || hash[31] != 0x1F) {
    std::cerr << "hash_tests: 32-byte slice rejected\n";
    return EXIT_FAILURE;
  }

  Hash256 untouched{};
  untouched.fill(0xAB);
  const auto before = untouched;
  const std::vector<std::uint8_t> short_slice(bytes.begin(), bytes.begin() + 31);
  bytes.push_back(0x20);
  if (Hash256FromBytes(short_slice, &untouched) || Hash256FromBytes(bytes, &untouched) ||
      untouched != before) {
    std::cerr << "hash_tests: slice of wrong length accepted\n";
    return EXIT_FAILURE;
  }

  // Display strings are byte-reversed.
  const std::string display = Hash256ToString(hash);
  if (display.substr(0, 4) != "1f1e" || display.substr(60) != "0100") {
    std::cerr << "hash_tests: unexpected display string " << display << "\n";
    return EXIT_FAILURE;
  }
  Hash256 parsed{};
  if (!Hash256FromString(display, &parsed) || parsed != hash) {
    std::cerr << "hash_tests: display string did not parse back\n";
    return EXIT_FAILURE;
  }

  // Leading zeros may be omitted.
  Hash256 small{};
  if (!Hash256FromString("1", &small) || small[0] != 0x01 || small[31] != 0x00) {
    std::cerr << "hash_tests: short display string not zero-extended\n";
    return EXIT_FAILURE;
  }

  Hash256 rejected{};
  if (Hash256FromString(std::string(65, '0'), &rejected) ||
      Hash256FromString("zz", &rejected)) {
    std::cerr << "hash_tests: invalid display string accepted\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
