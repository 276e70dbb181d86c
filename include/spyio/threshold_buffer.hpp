#pragma once
#include "spyio/stream.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace spyio {

// Something like MemoryStream, but switches to a temp file once a write
// would take it past `max_memory` bytes. The switch happens at most once;
// after it every operation goes to the file. close() deletes the file.
class ThresholdBuffer : public SeekableStream {
public:
  struct Config {
    std::size_t max_memory = 1024 * 1024; // 1 MiB
    std::string tmpdir     = "/tmp";
    std::string prefix     = "memfile-";
    std::string suffix     = ".tmp";
  };

  ThresholdBuffer();                       // uses default Config{}
  explicit ThresholdBuffer(Config cfg);
  ~ThresholdBuffer() override;

  ThresholdBuffer(const ThresholdBuffer&) = delete;
  ThresholdBuffer& operator=(const ThresholdBuffer&) = delete;

  void write(std::string_view data) override;

  using ReadStream::read;
  std::string read(std::size_t n) override;
  std::string readline() override;
  void flush() override;

  std::uint64_t seek(std::int64_t offset, Whence whence = Whence::Begin) override;
  std::uint64_t tell() const override;

  // Deletes the temp file if one was created. No-op while in memory.
  void close() override;

  bool in_memory() const noexcept { return in_memory_; }
  bool closed() const noexcept { return closed_; }

  // Logical content length, valid across the switch to disk.
  std::uint64_t size() const noexcept { return size_; }

  // Temp file path while disk-backed; empty otherwise.
  const std::filesystem::path& disk_path() const noexcept { return tmp_path_; }

  const Config& config() const noexcept { return cfg_; }

private:
  SeekableStream& backing() const;
  void switch_to_disk();

  Config cfg_;
  std::unique_ptr<SeekableStream> backing_;
  std::filesystem::path tmp_path_;
  std::uint64_t size_{0};
  bool in_memory_{true};
  bool closed_{false};
};

}
