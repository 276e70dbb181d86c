#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace spyio {

// Failure raised by the stream layer. `code()` carries errno when the
// failure came from the OS, 0 otherwise.
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& what, int code = 0);
  int code() const noexcept { return code_; }

private:
  int code_{0};
};

// Raised by TeeReader once the bytes it has seen exceed its max size.
// The bytes of the triggering read are already in the sink and counted;
// they are carried here so the caller can still hand them on.
class SizeLimitExceeded : public IoError {
public:
  SizeLimitExceeded(std::uint64_t seen, std::uint64_t max_size, std::string chunk);

  std::uint64_t seen() const noexcept { return seen_; }
  std::uint64_t max_size() const noexcept { return max_size_; }
  const std::string& chunk() const noexcept { return chunk_; }

private:
  std::uint64_t seen_;
  std::uint64_t max_size_;
  std::string chunk_;
};

// Builds an IoError from the current errno, e.g. "open /tmp/x: No such file or directory".
IoError errno_error(const std::string& what);

}
