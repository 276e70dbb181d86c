#include "spyio/memory_stream.hpp"
#include "spyio/io_error.hpp"
#include <algorithm>
#include <utility>

namespace spyio {

MemoryStream::MemoryStream(std::string initial) : buf_(std::move(initial)) {}

void MemoryStream::check_open() const {
  if (closed_) throw IoError("I/O operation on closed memory stream");
}

std::string MemoryStream::read(std::size_t n) {
  check_open();
  if (pos_ >= buf_.size()) return {};
  std::size_t take = std::min(n, buf_.size() - pos_);
  std::string out = buf_.substr(pos_, take);
  pos_ += take;
  return out;
}

std::string MemoryStream::readline() {
  check_open();
  if (pos_ >= buf_.size()) return {};
  std::size_t nl = buf_.find('\n', pos_);
  std::size_t end = (nl == std::string::npos) ? buf_.size() : nl + 1;
  std::string out = buf_.substr(pos_, end - pos_);
  pos_ = end;
  return out;
}

void MemoryStream::write(std::string_view data) {
  check_open();
  if (data.empty()) return;
  if (pos_ > buf_.size()) buf_.resize(pos_, '\0'); // seek past end leaves a zero gap
  const std::size_t overlap = std::min(data.size(), buf_.size() - pos_);
  buf_.replace(pos_, overlap, data.data(), data.size());
  pos_ += data.size();
}

std::uint64_t MemoryStream::seek(std::int64_t offset, Whence whence) {
  check_open();
  std::int64_t base = 0;
  switch (whence) {
    case Whence::Begin:   base = 0; break;
    case Whence::Current: base = static_cast<std::int64_t>(pos_); break;
    case Whence::End:     base = static_cast<std::int64_t>(buf_.size()); break;
  }
  const std::int64_t target = base + offset;
  if (target < 0) throw IoError("negative seek position " + std::to_string(target));
  pos_ = static_cast<std::size_t>(target);
  return pos_;
}

}
