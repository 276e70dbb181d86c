#pragma once
#include "spyio/file_pool.hpp"
#include "spyio/http_capture.hpp"
#include "spyio/threshold_buffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace spyio {

struct AppConfig {
  // Cap on body bytes a TeeReader may see; absent (or 0 in the file) -> no cap.
  std::optional<std::uint64_t> max_payload_size;
  ThresholdBuffer::Config memfile;
  FilePool::Config records;
  std::size_t chunk_size = 10 * 1024;
  LimitPolicy on_limit = LimitPolicy::Abort;
  int connect_timeout_s = 10;
  int read_timeout_s    = 30;
};

// "1048576", "512K", "1.5M", "2G" (binary multiples, optional trailing
// "B"/"iB"). Numeric part via fast_float. Fractions of a byte round down.
std::optional<std::uint64_t> parse_size(std::string_view s);

// JSON config via simdjson; fields left out keep their defaults.
// Returns false and fills err_out on malformed input.
bool parse_config(std::string_view json, AppConfig& out, std::string* err_out = nullptr);
bool load_config(const std::string& path, AppConfig& out, std::string* err_out = nullptr);

}
