#pragma once
#include "spyio/pull_iterator.hpp"
#include "spyio/stream.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace spyio {

// Iterates over the next `size` bytes of a stream, reading at most
// `chunk_size` bytes per step. An empty read ends the sequence early
// without error. Single pass; the stream is borrowed.
class ChunkIterator {
public:
  static constexpr std::size_t kDefaultChunkSize = 10 * 1024; // 10 KiB

  using ChunkCallback = std::function<bool(const std::string&)>;

  ChunkIterator(ReadStream& stream, std::uint64_t size,
                std::size_t chunk_size = kDefaultChunkSize);

  // False once the sequence has ended.
  bool next(std::string& out);

  PullIterator<ChunkIterator> begin() { return PullIterator<ChunkIterator>(this); }
  PullIterator<ChunkIterator> end() { return {}; }

  // Stops early (returning false) when cb returns false.
  bool for_each_chunk(const ChunkCallback& cb);

  std::uint64_t consumed() const noexcept { return consumed_; }
  std::uint64_t size() const noexcept { return size_; }
  // True when the stream ran dry before `size` bytes were seen.
  bool short_read() const noexcept { return done_ && consumed_ < size_; }

private:
  ReadStream& stream_;
  std::uint64_t size_;
  std::size_t chunk_size_;
  std::uint64_t consumed_{0};
  bool done_{false};
};

inline ChunkIterator file_chunks(ReadStream& stream, std::uint64_t size,
                                 std::size_t chunk_size = ChunkIterator::kDefaultChunkSize) {
  return ChunkIterator(stream, size, chunk_size);
}

}
