#include "spyio/chunk_iter.hpp"
#include <algorithm>
#include <stdexcept>

namespace spyio {

ChunkIterator::ChunkIterator(ReadStream& stream, std::uint64_t size, std::size_t chunk_size)
  : stream_(stream), size_(size), chunk_size_(chunk_size) {
  if (chunk_size == 0) throw std::invalid_argument("chunk_size == 0");
}

bool ChunkIterator::next(std::string& out) {
  if (done_ || consumed_ >= size_) { done_ = true; return false; }
  const std::size_t want = static_cast<std::size_t>(
      std::min<std::uint64_t>(size_ - consumed_, chunk_size_));
  out = stream_.read(want);
  if (out.empty()) { done_ = true; return false; }
  consumed_ += out.size();
  return true;
}

bool ChunkIterator::for_each_chunk(const ChunkCallback& cb) {
  std::string chunk;
  while (next(chunk)) {
    if (!cb(chunk)) return false;
  }
  return true;
}

}
