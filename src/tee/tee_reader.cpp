#include "spyio/tee_reader.hpp"
#include "spyio/io_error.hpp"
#include "spyio/memory_stream.hpp"
#include <utility>

namespace spyio {

TeeReader::TeeReader(ReadStream& source,
                     std::shared_ptr<WriteStream> sink,
                     std::optional<std::uint64_t> max_size)
  : source_(source),
    sink_(sink ? std::move(sink) : std::make_shared<MemoryStream>()),
    max_size_(max_size) {}

std::string TeeReader::record(std::string text) {
  sink_->write(text);
  bytes_seen_ += text.size();
  if (max_size_ && bytes_seen_ > *max_size_) {
    throw SizeLimitExceeded(bytes_seen_, *max_size_, std::move(text));
  }
  return text;
}

std::string TeeReader::read(std::size_t n) { return record(source_.read(n)); }

std::string TeeReader::readline() { return record(source_.readline()); }

bool TeeReader::LineRange::next(std::string& out) {
  out = r_->readline();
  return !out.empty();
}

bool TeeReader::for_each_line(const LineCallback& cb) {
  for (const auto& line : lines()) {
    if (!cb(line)) return false;
  }
  return true;
}

std::vector<std::string> TeeReader::readlines() {
  std::vector<std::string> out;
  for (const auto& line : lines()) out.push_back(line);
  return out;
}

void TeeReader::change_sink(std::shared_ptr<WriteStream> sink) {
  sink_->flush();
  sink_->close();
  sink_ = sink ? std::move(sink) : std::make_shared<MemoryStream>();
}

void TeeReader::close() { source_.close(); }

}
