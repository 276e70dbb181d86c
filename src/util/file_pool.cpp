#include "spyio/file_pool.hpp"
#include "spyio/io_error.hpp"
#include <cerrno>
#include <fcntl.h>

namespace spyio {

std::filesystem::path FilePool::path_for(std::uint64_t n) const {
  return std::filesystem::path(cfg_.dir) / (cfg_.prefix + std::to_string(n) + cfg_.suffix);
}

std::unique_ptr<FileStream> FilePool::get_file() {
  while (true) {
    const std::filesystem::path p = path_for(counter_);
    // O_EXCL closes the gap between "does it exist" and "create it"
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd >= 0) {
      last_ = p;
      return FileStream::adopt_fd(fd, p, "wb");
    }
    if (errno != EEXIST) throw errno_error("create " + p.string());
    ++counter_;
  }
}

}
