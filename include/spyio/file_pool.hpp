#pragma once
#include "spyio/file_stream.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace spyio {

// Hands out fresh output files named <dir>/<prefix><n><suffix>, skipping
// any name that already exists. Never overwrites.
class FilePool {
public:
  struct Config {
    std::string dir    = "/tmp";
    std::string prefix = "record-";
    std::string suffix = ".arc.gz";
  };

  FilePool() = default;
  explicit FilePool(Config cfg) : cfg_(std::move(cfg)) {}

  // Throws IoError if the directory is unusable.
  std::unique_ptr<FileStream> get_file();

  std::filesystem::path path_for(std::uint64_t n) const;
  const std::filesystem::path& last_path() const noexcept { return last_; }
  std::uint64_t counter() const noexcept { return counter_; }

private:
  Config cfg_;
  std::uint64_t counter_{0};
  std::filesystem::path last_;
};

}
