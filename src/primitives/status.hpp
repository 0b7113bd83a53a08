#pragma once

#include <string_view>

namespace blockwire::primitives {

enum class CodecStatus {
  kOk,
  // The underlying sink or source reported an I/O error.
  kStreamFailure,
  // The source ended before a fixed-width field was complete.
  kTruncatedInput,
  // A variable-length integer was cut short or not minimally encoded.
  kMalformedVarInt,
  // Internal consistency check failed; indicates a defect in this library.
  kInvariantViolation,
};

std::string_view CodecStatusName(CodecStatus status);

}  // namespace blockwire::primitives
