#include "primitives/stream.hpp"

#include <algorithm>

namespace blockwire::primitives {

bool VectorSink::Write(std::span<const std::uint8_t> data) {
  if (out_ == nullptr) return false;
  out_->insert(out_->end(), data.begin(), data.end());
  return true;
}

ReadStatus BufferSource::Read(std::span<std::uint8_t> out) {
  if (out.empty()) return ReadStatus::kOk;
  if (out.size() > Remaining()) {
    // Consume what is left so a later read cannot resume mid-field.
    offset_ = std::max(offset_, data_.size());
    return ReadStatus::kEndOfStream;
  }
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), out.size(), out.begin());
  offset_ += out.size();
  return ReadStatus::kOk;
}

bool OStreamSink::Write(std::span<const std::uint8_t> data) {
  if (out_ == nullptr || !out_->good()) return false;
  out_->write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
  return out_->good();
}

ReadStatus IStreamSource::Read(std::span<std::uint8_t> out) {
  if (in_ == nullptr) return ReadStatus::kError;
  if (out.empty()) return ReadStatus::kOk;
  in_->read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  if (in_->gcount() == static_cast<std::streamsize>(out.size())) {
    return ReadStatus::kOk;
  }
  if (in_->eof() && !in_->bad()) {
    return ReadStatus::kEndOfStream;
  }
  return ReadStatus::kError;
}

}  // namespace blockwire::primitives
