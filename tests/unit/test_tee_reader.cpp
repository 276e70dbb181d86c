#include "spyio/io_error.hpp"
#include "spyio/memory_stream.hpp"
#include "spyio/tee_reader.hpp"
#include "spyio/threshold_buffer.hpp"
#include "../test_util.hpp"

#include <memory>
#include <random>
#include <string>
#include <vector>

using spyio_test::expect;

static std::string make_payload(std::size_t n) {
  std::string s(n, '\0');
  std::mt19937 rng(7);
  for (auto& c : s) c = static_cast<char>(rng() & 0xff);
  return s;
}

// Arbitrary read sizes: what the caller gets and what the sink gets both
// equal the source, byte for byte.
static void lossless_read_through() {
  const std::string payload = make_payload(10000);
  std::mt19937 rng(1);
  std::uniform_int_distribution<std::size_t> step{1, 700};

  for (int round = 0; round < 20; ++round) {
    spyio::MemoryStream src(payload);
    auto sink = std::make_shared<spyio::MemoryStream>();
    spyio::TeeReader tee(src, sink);

    std::string got;
    for (std::string piece = tee.read(step(rng)); !piece.empty(); piece = tee.read(step(rng)))
      got += piece;

    expect(got == payload, "caller bytes differ from source");
    expect(sink->str() == payload, "sink bytes differ from source");
    expect(tee.bytes_seen() == payload.size(), "bytes_seen != payload size");
  }
}

static void default_read_and_default_sink() {
  spyio::MemoryStream src(std::string(100, 'x'));
  spyio::TeeReader tee(src);
  expect(tee.read() == std::string(100, 'x'), "read() with default size");
  expect(tee.read().empty(), "read() at end of stream");
  auto mem = std::dynamic_pointer_cast<spyio::MemoryStream>(tee.sink());
  expect(mem != nullptr, "default sink is a MemoryStream");
  expect(mem && mem->str() == std::string(100, 'x'), "default sink captured payload");
}

static void hello_world_readline() {
  spyio::MemoryStream src("hello\nworld\n");
  auto sink = std::make_shared<spyio::MemoryStream>();
  spyio::TeeReader tee(src, sink);

  expect(tee.readline() == "hello\n", "first readline");
  expect(tee.readline() == "world\n", "second readline");
  expect(tee.readline().empty(), "readline at end");
  expect(sink->str() == "hello\nworld\n", "sink holds both lines");
  expect(tee.bytes_seen() == 12, "bytes_seen == 12");
}

static void limit_not_hit_at_or_below_max() {
  for (std::size_t k : {0u, 1u, 63u, 64u}) {
    spyio::MemoryStream src(std::string(k, 'a'));
    spyio::TeeReader tee(src, nullptr, 64);
    try {
      while (!tee.read(10).empty()) {}
    } catch (const spyio::SizeLimitExceeded&) {
      expect(false, "limit tripped for source of " + std::to_string(k) + " bytes with max 64");
    }
  }
}

// max 25, reads of 10: the third call takes the count to 30 and must throw,
// still carrying its 10 bytes, which are already in the sink.
static void limit_trips_on_first_exceeding_call() {
  const std::string payload = make_payload(50);
  spyio::MemoryStream src(payload);
  auto sink = std::make_shared<spyio::MemoryStream>();
  spyio::TeeReader tee(src, sink, 25);

  expect(tee.read(10).size() == 10, "call 1");
  expect(tee.read(10).size() == 10, "call 2");
  bool thrown = false;
  try {
    (void)tee.read(10);
  } catch (const spyio::SizeLimitExceeded& e) {
    thrown = true;
    expect(e.seen() == 30, "seen == 30");
    expect(e.max_size() == 25, "max_size == 25");
    expect(e.chunk() == payload.substr(20, 10), "exception carries the triggering bytes");
    expect(std::string(e.what()) == "spy file limit exceeded 30 (max size : 25)", "message");
  }
  expect(thrown, "third call throws");
  expect(tee.bytes_seen() == 30, "counter updated before throw");
  expect(sink->str() == payload.substr(0, 30), "sink recorded before throw");

  // exactly at the limit does not trip; one more byte does
  spyio::MemoryStream src2(std::string(26, 'b'));
  spyio::TeeReader tee2(src2, nullptr, 25);
  expect(tee2.read(25).size() == 25, "reading exactly max");
  thrown = false;
  try { (void)tee2.read(1); } catch (const spyio::SizeLimitExceeded& e) { thrown = (e.chunk() == "b"); }
  expect(thrown, "one byte past max trips");
}

static void size_limit_is_an_io_error() {
  spyio::MemoryStream src("0123456789");
  spyio::TeeReader tee(src, nullptr, 3);
  bool caught = false;
  try { (void)tee.readline(); } catch (const spyio::IoError&) { caught = true; }
  expect(caught, "SizeLimitExceeded is caught as IoError");
}

static void continue_with_limit_disabled() {
  spyio::MemoryStream src("aaaa\nbbbb\ncccc\n");
  auto sink = std::make_shared<spyio::MemoryStream>();
  spyio::TeeReader tee(src, sink, 6);
  std::vector<std::string> lines;
  try {
    for (const auto& l : tee.lines()) lines.push_back(l);
  } catch (const spyio::SizeLimitExceeded& e) {
    lines.push_back(e.chunk());
    tee.set_max_size(std::nullopt);
    for (const auto& l : tee.lines()) lines.push_back(l);
  }
  expect(lines.size() == 3, "all lines delivered after disabling limit");
  expect(sink->str() == "aaaa\nbbbb\ncccc\n", "sink complete");
}

static void line_iteration() {
  spyio::MemoryStream src("a\nbb\nccc");
  auto sink = std::make_shared<spyio::MemoryStream>();
  spyio::TeeReader tee(src, sink);
  auto lines = tee.readlines();
  expect(lines.size() == 3 && lines[2] == "ccc", "readlines keeps unterminated tail");
  expect(sink->str() == "a\nbb\nccc", "lines mirrored");
  expect(tee.readlines().empty(), "sequence is not restartable");

  spyio::MemoryStream src2("1\n2\n3\n4\n");
  spyio::TeeReader tee2(src2);
  int seen = 0;
  bool all = tee2.for_each_line([&](const std::string&) { return ++seen < 2; });
  expect(!all && seen == 2, "for_each_line stops when callback says so");
  expect(tee2.readline() == "3\n", "stream left after the last consumed line");
}

static void change_sink_closes_previous() {
  spyio::MemoryStream src("first-second");
  auto a = std::make_shared<spyio::MemoryStream>();
  auto b = std::make_shared<spyio::MemoryStream>();
  spyio::TeeReader tee(src, a);
  (void)tee.read(6);
  tee.change_sink(b);
  (void)tee.read(6);
  expect(a->closed(), "old sink closed");
  expect(a->str() == "first-", "old sink kept its bytes");
  expect(b->str() == "second", "new sink only sees later bytes");
  expect(tee.sink() == b, "sink() reports the new sink");
  expect(tee.bytes_seen() == 12, "change_sink does not touch the counter");
}

static void close_closes_source_not_sink() {
  spyio::MemoryStream src("abc");
  auto sink = std::make_shared<spyio::MemoryStream>();
  spyio::TeeReader tee(src, sink);
  (void)tee.read(3);
  tee.close();
  expect(src.closed(), "source closed");
  expect(!sink->closed(), "sink left open");
  bool threw = false;
  try { (void)tee.read(1); } catch (const spyio::IoError&) { threw = true; }
  expect(threw, "read after close fails");
}

static void spills_capture_to_disk() {
  auto dir = spyio_test::scratch_dir("tee");
  const std::string payload = make_payload(5000);
  spyio::MemoryStream src(payload);
  spyio::ThresholdBuffer::Config cfg;
  cfg.max_memory = 1024;
  cfg.tmpdir = dir.string();
  auto buf = std::make_shared<spyio::ThresholdBuffer>(cfg);
  spyio::TeeReader tee(src, buf);
  while (!tee.read(300).empty()) {}
  expect(!buf->in_memory(), "capture spilled");
  buf->seek(0);
  expect(buf->read(payload.size() + 1) == payload, "spilled capture intact");
  buf->close();
  expect(spyio_test::count_files(dir) == 0, "temp file removed");
  std::filesystem::remove_all(dir);
}

static void spy_builds_a_reader() {
  spyio::MemoryStream src("abcdef");
  auto sink = std::make_shared<spyio::MemoryStream>();
  auto tee = spyio::spy(src, sink, 4);
  expect(tee.max_size() && *tee.max_size() == 4, "spy passes max_size");
  expect(tee.read(3) == "abc", "spy reader reads");
  bool threw = false;
  try { (void)tee.read(3); } catch (const spyio::SizeLimitExceeded&) { threw = true; }
  expect(threw, "spy reader enforces the limit");
  expect(sink->str() == "abcdef", "spy reader mirrors into the given sink");
}

int main() {
  lossless_read_through();
  default_read_and_default_sink();
  hello_world_readline();
  limit_not_hit_at_or_below_max();
  limit_trips_on_first_exceeding_call();
  size_limit_is_an_io_error();
  continue_with_limit_disabled();
  line_iteration();
  change_sink_closes_previous();
  close_closes_source_not_sink();
  spills_capture_to_disk();
  spy_builds_a_reader();
  return spyio_test::finish("tee_reader");
}
