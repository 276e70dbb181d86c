#pragma once
#include "spyio/pull_iterator.hpp"
#include "spyio/stream.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spyio {

// Records everything read from a stream as someone is reading from it.
//
//   caller <--- TeeReader <--- source
//                   |
//                   v
//                 sink
//
// Every chunk handed back by read()/readline() is first appended to the
// sink and counted. With a max size set, the call that makes the count
// exceed it throws SizeLimitExceeded after recording, carrying the chunk.
class TeeReader : public ReadStream {
public:
  using LineCallback = std::function<bool(const std::string&)>;

  // `source` is borrowed and must outlive the reader. A null sink gets
  // a fresh MemoryStream.
  explicit TeeReader(ReadStream& source,
                     std::shared_ptr<WriteStream> sink = nullptr,
                     std::optional<std::uint64_t> max_size = std::nullopt);

  using ReadStream::read;
  std::string read(std::size_t n) override;
  std::string readline() override;

  // Lazy line sequence; ends at the first empty readline().
  class LineRange {
  public:
    explicit LineRange(TeeReader& r) : r_(&r) {}
    bool next(std::string& out);
    PullIterator<LineRange> begin() { return PullIterator<LineRange>(this); }
    PullIterator<LineRange> end() { return {}; }

  private:
    TeeReader* r_;
  };

  LineRange lines() { return LineRange(*this); }

  // Stops early (returning false) when cb returns false.
  bool for_each_line(const LineCallback& cb);
  std::vector<std::string> readlines();

  // Flushes and closes the current sink, then mirrors into `sink`.
  void change_sink(std::shared_ptr<WriteStream> sink);
  const std::shared_ptr<WriteStream>& sink() const noexcept { return sink_; }

  std::uint64_t bytes_seen() const noexcept { return bytes_seen_; }
  std::optional<std::uint64_t> max_size() const noexcept { return max_size_; }
  void set_max_size(std::optional<std::uint64_t> max_size) noexcept { max_size_ = max_size; }

  // Closes the source only; the sink stays open for inspection.
  void close() override;

private:
  std::string record(std::string text);

  ReadStream& source_;
  std::shared_ptr<WriteStream> sink_;
  std::optional<std::uint64_t> max_size_;
  std::uint64_t bytes_seen_{0};
};

// Convenience mirror of the constructor.
inline TeeReader spy(ReadStream& source,
                     std::shared_ptr<WriteStream> sink = nullptr,
                     std::optional<std::uint64_t> max_size = std::nullopt) {
  return TeeReader(source, std::move(sink), max_size);
}

}
