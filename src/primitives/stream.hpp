#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include <vector>

namespace blockwire::primitives {

class ByteSink {
 public:
  virtual ~ByteSink() = default;
  // Writes all of `data`. Returns false on I/O failure, after which the
  // sink contents are unspecified.
  virtual bool Write(std::span<const std::uint8_t> data) = 0;
};

enum class ReadStatus {
  kOk,
  kEndOfStream,
  kError,
};

class ByteSource {
 public:
  virtual ~ByteSource() = default;
  // Fills `out` completely, or reports why it could not.
  virtual ReadStatus Read(std::span<std::uint8_t> out) = 0;
};

class VectorSink : public ByteSink {
 public:
  explicit VectorSink(std::vector<std::uint8_t>* out) : out_(out) {}

  bool Write(std::span<const std::uint8_t> data) override;

 private:
  std::vector<std::uint8_t>* out_;
};

// Reads from a caller-owned buffer, which must outlive the source.
class BufferSource : public ByteSource {
 public:
  explicit BufferSource(std::span<const std::uint8_t> data, std::size_t offset = 0)
      : data_(data), offset_(offset) {}

  ReadStatus Read(std::span<std::uint8_t> out) override;

  std::size_t Offset() const { return offset_; }
  std::size_t Remaining() const { return offset_ < data_.size() ? data_.size() - offset_ : 0; }

 private:
  std::span<const std::uint8_t> data_;
  std::size_t offset_;
};

class OStreamSink : public ByteSink {
 public:
  explicit OStreamSink(std::ostream* out) : out_(out) {}

  bool Write(std::span<const std::uint8_t> data) override;

 private:
  std::ostream* out_;
};

class IStreamSource : public ByteSource {
 public:
  explicit IStreamSource(std::istream* in) : in_(in) {}

  ReadStatus Read(std::span<std::uint8_t> out) override;

 private:
  std::istream* in_;
};

}  // namespace blockwire::primitives
