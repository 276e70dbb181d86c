#pragma once
#include "spyio/stream.hpp"
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

namespace spyio {

// Seekable stream over a C stdio handle. Reads and writes may be
// interleaved freely; the required repositioning between them is done here.
class FileStream : public SeekableStream {
public:
  // fopen-style mode ("rb", "wb", "w+b", ...). Throws IoError on failure.
  static std::unique_ptr<FileStream> open(const std::filesystem::path& path, const char* mode);

  // Adopts an open descriptor (e.g. from mkstemp or open(O_EXCL)).
  static std::unique_ptr<FileStream> adopt_fd(int fd, const std::filesystem::path& path, const char* mode);

  FileStream(std::FILE* f, std::filesystem::path path);
  ~FileStream() override;

  FileStream(const FileStream&) = delete;
  FileStream& operator=(const FileStream&) = delete;

  using ReadStream::read;
  std::string read(std::size_t n) override;
  std::string readline() override;
  void write(std::string_view data) override;
  void flush() override;

  std::uint64_t seek(std::int64_t offset, Whence whence = Whence::Begin) override;
  std::uint64_t tell() const override;

  void close() override;
  bool closed() const noexcept { return f_ == nullptr; }

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  enum class LastOp { None, Read, Write };

  std::FILE* handle() const;
  void switch_to(LastOp op);

  std::FILE* f_{nullptr};
  std::filesystem::path path_;
  LastOp last_{LastOp::None};
};

}
