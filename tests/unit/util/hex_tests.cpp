#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "util/hex.hpp"

int main() {
  using namespace blockwire::util;

  const std::vector<std::uint8_t> data = {0x00, 0x1d, 0xff, 0xA0};
  if (HexEncode(data) != "001dffa0") {
    std::cerr << "hex_tests: HexEncode mismatch\n";
    return EXIT_FAILURE;
  }
  if (HexEncodeReversed(data) != "a0ff1d00") {
    std::cerr << "hex_tests: HexEncodeReversed mismatch\n";
    return EXIT_FAILURE;
  }

  std::vector<std::uint8_t> decoded;
  if (!HexDecode("001DffA0", &decoded) || decoded != data) {
    std::cerr << "hex_tests: mixed-case decode failed\n";
    return EXIT_FAILURE;
  }
  if (HexDecode("abc", &decoded) || !decoded.empty()) {
    std::cerr << "hex_tests: odd-length input accepted\n";
    return EXIT_FAILURE;
  }
  if (HexDecode("0g", &decoded) || !decoded.empty()) {
    std::cerr << "hex_tests: non-hex input accepted\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
