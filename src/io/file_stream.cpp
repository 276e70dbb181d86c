#include "spyio/file_stream.hpp"
#include "spyio/io_error.hpp"
#include <cerrno>
#include <iostream>
#include <utility>
#include <sys/types.h>
#include <unistd.h>

namespace spyio {

std::unique_ptr<FileStream> FileStream::open(const std::filesystem::path& path, const char* mode) {
  std::FILE* f = std::fopen(path.c_str(), mode);
  if (!f) throw errno_error("open " + path.string());
  return std::make_unique<FileStream>(f, path);
}

std::unique_ptr<FileStream> FileStream::adopt_fd(int fd, const std::filesystem::path& path, const char* mode) {
  std::FILE* f = ::fdopen(fd, mode);
  if (!f) {
    IoError err = errno_error("fdopen " + path.string());
    ::close(fd);
    throw err;
  }
  return std::make_unique<FileStream>(f, path);
}

FileStream::FileStream(std::FILE* f, std::filesystem::path path)
  : f_(f), path_(std::move(path)) {}

FileStream::~FileStream() {
  if (f_ && std::fclose(f_) != 0) {
    std::cerr << "[file] close failed for " << path_.string() << "\n";
  }
}

std::FILE* FileStream::handle() const {
  if (!f_) throw IoError("I/O operation on closed file " + path_.string());
  return f_;
}

// C stdio needs a positioning call between output and input (either order).
void FileStream::switch_to(LastOp op) {
  std::FILE* f = handle();
  if (last_ != LastOp::None && last_ != op) {
    if (::fseeko(f, 0, SEEK_CUR) != 0) throw errno_error("reposition " + path_.string());
  }
  last_ = op;
}

std::string FileStream::read(std::size_t n) {
  switch_to(LastOp::Read);
  std::string out(n, '\0');
  std::size_t got = std::fread(out.data(), 1, n, f_);
  if (got < n && std::ferror(f_)) {
    std::clearerr(f_);
    throw errno_error("read " + path_.string());
  }
  out.resize(got);
  return out;
}

std::string FileStream::readline() {
  switch_to(LastOp::Read);
  std::string out;
  int c;
  while ((c = std::getc(f_)) != EOF) {
    out.push_back(static_cast<char>(c));
    if (c == '\n') break;
  }
  if (std::ferror(f_)) {
    std::clearerr(f_);
    throw errno_error("readline " + path_.string());
  }
  return out;
}

void FileStream::write(std::string_view data) {
  switch_to(LastOp::Write);
  if (data.empty()) return;
  if (std::fwrite(data.data(), 1, data.size(), f_) != data.size()) {
    std::clearerr(f_);
    throw errno_error("write " + path_.string());
  }
}

void FileStream::flush() {
  if (std::fflush(handle()) != 0) throw errno_error("flush " + path_.string());
}

std::uint64_t FileStream::seek(std::int64_t offset, Whence whence) {
  std::FILE* f = handle();
  int w = SEEK_SET;
  if (whence == Whence::Current) w = SEEK_CUR;
  else if (whence == Whence::End) w = SEEK_END;
  if (::fseeko(f, static_cast<off_t>(offset), w) != 0) throw errno_error("seek " + path_.string());
  last_ = LastOp::None;
  return tell();
}

std::uint64_t FileStream::tell() const {
  off_t pos = ::ftello(handle());
  if (pos < 0) throw errno_error("tell " + path_.string());
  return static_cast<std::uint64_t>(pos);
}

void FileStream::close() {
  if (!f_) return;
  std::FILE* f = f_;
  f_ = nullptr;
  if (std::fclose(f) != 0) throw errno_error("close " + path_.string());
}

}
