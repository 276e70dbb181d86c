#pragma once
#include "spyio/stream.hpp"
#include <string>

namespace spyio {

// In-memory seekable byte buffer. Writes overwrite at the current
// position and extend the buffer past its end.
class MemoryStream : public SeekableStream {
public:
  MemoryStream() = default;
  explicit MemoryStream(std::string initial);

  using ReadStream::read;
  std::string read(std::size_t n) override;
  std::string readline() override;
  void write(std::string_view data) override;

  std::uint64_t seek(std::int64_t offset, Whence whence = Whence::Begin) override;
  std::uint64_t tell() const override { return pos_; }

  void close() override { closed_ = true; }
  bool closed() const noexcept { return closed_; }

  // Whole content regardless of position.
  const std::string& str() const noexcept { return buf_; }
  std::size_t size() const noexcept { return buf_.size(); }

private:
  void check_open() const;

  std::string buf_;
  std::size_t pos_{0};
  bool closed_{false};
};

}
