#include "primitives/status.hpp"

namespace blockwire::primitives {

std::string_view CodecStatusName(CodecStatus status) {
  switch (status) {
    case CodecStatus::kOk:
      return "ok";
    case CodecStatus::kStreamFailure:
      return "stream failure";
    case CodecStatus::kTruncatedInput:
      return "truncated input";
    case CodecStatus::kMalformedVarInt:
      return "malformed varint";
    case CodecStatus::kInvariantViolation:
      return "invariant violation";
  }
  return "unknown";
}

}  // namespace blockwire::primitives
