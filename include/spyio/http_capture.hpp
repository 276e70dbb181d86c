#pragma once
#include "spyio/threshold_buffer.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spyio {

// What to do once a response body crosses max_payload_size.
//   Abort       -> cancel the transfer, keep the partial capture
//   Passthrough -> drop the capture, keep feeding the consumer
enum class LimitPolicy { Abort, Passthrough };

std::optional<LimitPolicy> parse_limit_policy(std::string_view s);
const char* to_string(LimitPolicy p);

struct CaptureResult {
  int status = 0;
  std::uint64_t bytes_seen = 0;   // body bytes handed to the consumer
  bool limit_exceeded = false;
  bool captured = false;          // capture() holds the body seen so far
  bool in_memory = true;          // capture never spilled to disk
  std::string sha256;             // of the captured copy, when captured
  std::string error;
};

// Tiny wrapper around cpp-httplib's client: streams a GET body to a
// consumer while a TeeReader mirrors it into a ThresholdBuffer.
class HttpCapture {
public:
  struct Config {
    std::string base_url;                          // e.g. "http://127.0.0.1:8080"
    std::optional<std::uint64_t> max_payload_size; // absent -> unbounded
    ThresholdBuffer::Config buffer;
    LimitPolicy on_limit = LimitPolicy::Abort;
    std::size_t chunk_size = 10 * 1024;            // tee read step and digest chunk
    int connect_timeout_s = 10;
    int read_timeout_s    = 30;
  };

  // Return false to stop the transfer.
  using BodyCallback = std::function<bool(std::string_view)>;

  explicit HttpCapture(Config cfg);
  ~HttpCapture();

  HttpCapture(const HttpCapture&) = delete;
  HttpCapture& operator=(const HttpCapture&) = delete;

  // True when the whole body was received. Never throws for transport,
  // limit or buffer failures; see out.error.
  bool fetch(const std::string& path, const BodyCallback& on_body, CaptureResult& out);

  // Capture of the last fetch, positioned at its end; null when dropped.
  std::shared_ptr<ThresholdBuffer> capture() const;

  const Config& config() const noexcept;

private:
  struct Impl;
  Impl* p_;
};

}
