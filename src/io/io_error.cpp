#include "spyio/io_error.hpp"
#include <cerrno>
#include <cstring>
#include <utility>

namespace spyio {

IoError::IoError(const std::string& what, int code)
  : std::runtime_error(what), code_(code) {}

SizeLimitExceeded::SizeLimitExceeded(std::uint64_t seen, std::uint64_t max_size, std::string chunk)
  : IoError("spy file limit exceeded " + std::to_string(seen) +
            " (max size : " + std::to_string(max_size) + ")"),
    seen_(seen), max_size_(max_size), chunk_(std::move(chunk)) {}

IoError errno_error(const std::string& what) {
  const int e = errno;
  return IoError(what + ": " + std::strerror(e), e);
}

}
