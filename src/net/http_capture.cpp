#include "spyio/http_capture.hpp"
#include "spyio/chunk_iter.hpp"
#include "spyio/digest.hpp"
#include "spyio/io_error.hpp"
#include "spyio/tee_reader.hpp"
#include <httplib.h>
#include <algorithm>
#include <iostream>
#include <utility>

namespace spyio {

namespace {

// Holds the network chunk currently being pushed through the tee.
// Running dry means "wait for the next chunk", not end of body.
class PendingChunk : public ReadStream {
public:
  void feed(const char* data, std::size_t len) {
    data_ = std::string_view(data, len);
    off_ = 0;
  }

  using ReadStream::read;
  std::string read(std::size_t n) override {
    std::size_t take = std::min(n, data_.size() - off_);
    std::string out(data_.substr(off_, take));
    off_ += take;
    return out;
  }

  std::string readline() override {
    std::size_t nl = data_.find('\n', off_);
    std::size_t end = (nl == std::string_view::npos) ? data_.size() : nl + 1;
    std::string out(data_.substr(off_, end - off_));
    off_ = end;
    return out;
  }

  void close() override { data_ = {}; off_ = 0; }

private:
  std::string_view data_;
  std::size_t off_{0};
};

std::string digest_of(ThresholdBuffer& buf, std::size_t chunk_size) {
  buf.flush();
  buf.seek(0);
  Sha256 h;
  ChunkIterator chunks(buf, buf.size(), chunk_size);
  for (const auto& c : chunks) h.update(c);
  buf.seek(0, Whence::End);
  return h.hex_digest();
}

}

std::optional<LimitPolicy> parse_limit_policy(std::string_view s) {
  if (s == "abort") return LimitPolicy::Abort;
  if (s == "passthrough") return LimitPolicy::Passthrough;
  return std::nullopt;
}

const char* to_string(LimitPolicy p) {
  return p == LimitPolicy::Abort ? "abort" : "passthrough";
}

struct HttpCapture::Impl {
  Config cfg;
  std::shared_ptr<ThresholdBuffer> last;

  explicit Impl(Config c) : cfg(std::move(c)) {}
};

HttpCapture::HttpCapture(Config cfg) : p_(new Impl(std::move(cfg))) {}
HttpCapture::~HttpCapture() { delete p_; }

std::shared_ptr<ThresholdBuffer> HttpCapture::capture() const { return p_->last; }
const HttpCapture::Config& HttpCapture::config() const noexcept { return p_->cfg; }

bool HttpCapture::fetch(const std::string& path, const BodyCallback& on_body, CaptureResult& out) {
  out = CaptureResult{};
  p_->last = std::make_shared<ThresholdBuffer>(p_->cfg.buffer);

  const std::size_t step = p_->cfg.chunk_size ? p_->cfg.chunk_size : ChunkIterator::kDefaultChunkSize;
  PendingChunk pending;
  TeeReader tee(pending, p_->last, p_->cfg.max_payload_size);

  bool consumer_stopped = false;
  bool stopped_on_limit = false;
  std::string io_error;

  auto deliver = [&](std::string_view piece) {
    if (on_body && !on_body(piece)) { consumer_stopped = true; return false; }
    return true;
  };

  auto drain = [&]() {
    for (std::string piece = tee.read(step); !piece.empty(); piece = tee.read(step)) {
      if (!deliver(piece)) return false;
    }
    return true;
  };

  // The tee has already recorded e.chunk(); the consumer still gets it.
  auto on_limit = [&](const SizeLimitExceeded& e) {
    out.limit_exceeded = true;
    std::cerr << "[capture] " << e.what() << " for " << path
              << " (" << to_string(p_->cfg.on_limit) << ")\n";
    if (!deliver(e.chunk())) return false;
    if (p_->cfg.on_limit == LimitPolicy::Abort) { stopped_on_limit = true; return false; }
    tee.set_max_size(std::nullopt);
    tee.change_sink(std::make_shared<NullStream>());
    p_->last.reset();
    return true;
  };

  httplib::Client cli(p_->cfg.base_url);
  if (!cli.is_valid()) {
    out.error = "invalid base url: " + p_->cfg.base_url;
    return false;
  }
  cli.set_connection_timeout(p_->cfg.connect_timeout_s, 0);
  cli.set_read_timeout(p_->cfg.read_timeout_s, 0);

  auto res = cli.Get(
      path,
      [&](const httplib::Response& r) {
        out.status = r.status;
        return true;
      },
      [&](const char* data, size_t len) {
        pending.feed(data, len);
        try {
          try {
            return drain();
          } catch (const SizeLimitExceeded& e) {
            return on_limit(e) && drain();
          }
        } catch (const IoError& e) {
          io_error = e.what();
          return false;
        }
      });

  out.bytes_seen = tee.bytes_seen();
  tee.close();

  bool ok = static_cast<bool>(res);
  if (!ok) {
    if (stopped_on_limit)      out.error = "size limit exceeded";
    else if (!io_error.empty()) out.error = io_error;
    else if (consumer_stopped)  out.error = "stopped by consumer";
    else                        out.error = httplib::to_string(res.error());
  }

  if (p_->last) {
    try {
      out.captured = true;
      out.in_memory = p_->last->in_memory();
      out.sha256 = digest_of(*p_->last, step);
    } catch (const IoError& e) {
      out.error = std::string("capture unreadable: ") + e.what();
      ok = false;
    }
  }
  return ok;
}

}
