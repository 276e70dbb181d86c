#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace spyio {

enum class Whence { Begin, Current, End };

// Readable half of the file-like surface.
class ReadStream {
public:
  static constexpr std::size_t kDefaultReadSize = 64 * 1024;

  virtual ~ReadStream() = default;

  // Up to n bytes; empty only at end of stream.
  virtual std::string read(std::size_t n) = 0;
  std::string read() { return read(kDefaultReadSize); }

  // Through and including the next '\n', or to end of stream.
  virtual std::string readline() = 0;

  virtual void close() = 0;
};

// Writable half of the file-like surface.
class WriteStream {
public:
  virtual ~WriteStream() = default;

  virtual void write(std::string_view data) = 0;
  virtual void flush() {}
  virtual void close() = 0;

  template <class Lines>
  void write_lines(const Lines& lines) {
    for (const auto& line : lines) write(line);
  }
};

// Both halves plus a position. MemoryStream, FileStream and
// ThresholdBuffer all implement this.
class SeekableStream : public ReadStream, public WriteStream {
public:
  virtual std::uint64_t seek(std::int64_t offset, Whence whence = Whence::Begin) = 0;
  virtual std::uint64_t tell() const = 0;

  void close() override = 0;
};

// Discards everything written to it.
class NullStream : public WriteStream {
public:
  void write(std::string_view) override {}
  void close() override {}
};

}
