#include "spyio/threshold_buffer.hpp"
#include "spyio/file_stream.hpp"
#include "spyio/io_error.hpp"
#include "spyio/memory_stream.hpp"
#include <algorithm>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>
#include <system_error>
#include <utility>
#include <vector>

namespace spyio {

// Private (0600, close-on-exec) file in cfg.tmpdir named <prefix>XXXXXX<suffix>.
static std::unique_ptr<FileStream> open_tmpfile(const ThresholdBuffer::Config& cfg) {
  const std::string pattern =
      (std::filesystem::path(cfg.tmpdir) / (cfg.prefix + "XXXXXX" + cfg.suffix)).string();
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');
  int fd = ::mkostemps(name.data(), static_cast<int>(cfg.suffix.size()), O_CLOEXEC);
  if (fd < 0) throw errno_error("create temp file " + pattern);
  return FileStream::adopt_fd(fd, std::filesystem::path(name.data()), "w+b");
}

static void remove_tmpfile(const std::filesystem::path& p) {
  std::cerr << "[memfile] removing temp file " << p.string() << "\n";
  std::error_code ec;
  if (!std::filesystem::remove(p, ec)) {
    std::cerr << "[memfile] could not remove " << p.string()
              << (ec ? ": " + ec.message() : std::string(": already gone")) << "\n";
  }
}

ThresholdBuffer::ThresholdBuffer() : ThresholdBuffer(Config{}) {}

ThresholdBuffer::ThresholdBuffer(Config cfg)
  : cfg_(std::move(cfg)), backing_(std::make_unique<MemoryStream>()) {}

ThresholdBuffer::~ThresholdBuffer() {
  if (closed_ || in_memory_) return;
  try {
    close();
  } catch (const IoError& e) {
    std::cerr << "[memfile] close during teardown failed: " << e.what() << "\n";
  }
}

SeekableStream& ThresholdBuffer::backing() const {
  if (closed_) throw IoError("I/O operation on closed buffer");
  return *backing_;
}

void ThresholdBuffer::switch_to_disk() {
  SeekableStream& mem = backing();
  const std::uint64_t pos = mem.tell();
  mem.seek(0);
  const std::string content = mem.read(static_cast<std::size_t>(size_));
  mem.seek(static_cast<std::int64_t>(pos));

  std::unique_ptr<FileStream> file = open_tmpfile(cfg_);
  try {
    file->write(content);
    file->seek(static_cast<std::int64_t>(pos));
  } catch (const IoError&) {
    const std::filesystem::path p = file->path();
    file.reset();
    remove_tmpfile(p);
    throw;
  }

  tmp_path_ = file->path();
  backing_ = std::move(file);
  in_memory_ = false;
}

void ThresholdBuffer::write(std::string_view data) {
  const std::uint64_t pos = backing().tell();
  // An empty write never extends the content, even past the end.
  if (data.empty()) return;
  if (in_memory_ && pos + data.size() > cfg_.max_memory) {
    switch_to_disk();
  }
  backing_->write(data);
  size_ = std::max<std::uint64_t>(size_, pos + data.size());
}

std::string ThresholdBuffer::read(std::size_t n) { return backing().read(n); }

std::string ThresholdBuffer::readline() { return backing().readline(); }

void ThresholdBuffer::flush() { backing().flush(); }

std::uint64_t ThresholdBuffer::seek(std::int64_t offset, Whence whence) {
  return backing().seek(offset, whence);
}

std::uint64_t ThresholdBuffer::tell() const { return backing().tell(); }

void ThresholdBuffer::close() {
  if (closed_ || in_memory_) return;
  closed_ = true;
  std::unique_ptr<SeekableStream> file = std::move(backing_);
  const std::filesystem::path p = std::move(tmp_path_);
  tmp_path_.clear();
  try {
    file->close();
  } catch (const IoError&) {
    remove_tmpfile(p);
    throw;
  }
  remove_tmpfile(p);
}

}
