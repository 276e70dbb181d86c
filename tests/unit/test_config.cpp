#include "spyio/config.hpp"
#include "../test_util.hpp"

#include <fstream>
#include <string>

using spyio_test::expect;

static void sizes() {
  expect(spyio::parse_size("1048576") == std::optional<std::uint64_t>(1048576), "plain integer");
  expect(spyio::parse_size(" 512K ") == std::optional<std::uint64_t>(512 * 1024), "K suffix, spaces");
  expect(spyio::parse_size("1.5M") == std::optional<std::uint64_t>(1536 * 1024), "fractional M");
  expect(spyio::parse_size("2GiB") == std::optional<std::uint64_t>(2ull << 30), "GiB");
  expect(spyio::parse_size("10 kb") == std::optional<std::uint64_t>(10 * 1024), "lowercase kb");
  expect(spyio::parse_size("0") == std::optional<std::uint64_t>(0), "zero");
  expect(!spyio::parse_size(""), "empty rejected");
  expect(!spyio::parse_size("-5"), "negative rejected");
  expect(!spyio::parse_size("12Q"), "unknown unit rejected");
  expect(!spyio::parse_size("MB"), "missing number rejected");
  expect(!spyio::parse_size("nan"), "nan rejected");
}

static void defaults() {
  spyio::AppConfig c;
  std::string err;
  expect(spyio::parse_config("{}", c, &err), "empty object parses: " + err);
  expect(!c.max_payload_size, "no cap by default");
  expect(c.memfile.max_memory == 1024 * 1024, "1 MiB memfile default");
  expect(c.memfile.prefix == "memfile-" && c.memfile.suffix == ".tmp", "memfile naming default");
  expect(c.records.prefix == "record-", "records default");
  expect(c.on_limit == spyio::LimitPolicy::Abort, "abort by default");
}

static void full_document() {
  const char* json = R"({
    "max_payload_size": "10M",
    "memfile": { "max_memory": 65536, "tmpdir": "/var/tmp", "prefix": "cap-", "suffix": ".part" },
    "records": { "dir": "/srv/records", "suffix": ".bin" },
    "chunk_size": "4K",
    "on_limit": "passthrough",
    "connect_timeout_s": 3,
    "read_timeout_s": 45,
    "unknown_knob": [1, 2, 3]
  })";
  spyio::AppConfig c;
  std::string err;
  expect(spyio::parse_config(json, c, &err), "full document parses: " + err);
  expect(c.max_payload_size == std::optional<std::uint64_t>(10u << 20), "max_payload_size");
  expect(c.memfile.max_memory == 65536, "memfile.max_memory");
  expect(c.memfile.tmpdir == "/var/tmp", "memfile.tmpdir");
  expect(c.memfile.prefix == "cap-" && c.memfile.suffix == ".part", "memfile naming");
  expect(c.records.dir == "/srv/records" && c.records.suffix == ".bin", "records");
  expect(c.records.prefix == "record-", "records.prefix keeps default");
  expect(c.chunk_size == 4096, "chunk_size");
  expect(c.on_limit == spyio::LimitPolicy::Passthrough, "on_limit");
  expect(c.connect_timeout_s == 3 && c.read_timeout_s == 45, "timeouts");
}

static void zero_or_null_limit_means_unbounded() {
  spyio::AppConfig c;
  c.max_payload_size = 5;
  expect(spyio::parse_config(R"({"max_payload_size": 0})", c), "zero parses");
  expect(!c.max_payload_size, "zero disables the cap");
  c.max_payload_size = 5;
  expect(spyio::parse_config(R"({"max_payload_size": null})", c), "null parses");
  expect(!c.max_payload_size, "null disables the cap");
}

static void errors_leave_config_untouched() {
  spyio::AppConfig c;
  c.chunk_size = 77;
  std::string err;
  expect(!spyio::parse_config(R"({"chunk_size": 1024, "on_limit": "explode"})", c, &err), "bad policy fails");
  expect(err.find("on_limit") != std::string::npos, "error names the key: " + err);
  expect(c.chunk_size == 77, "failed parse leaves config unchanged");

  expect(!spyio::parse_config(R"({"max_payload_size": "lots"})", c, &err), "bad size fails");
  expect(err.find("max_payload_size") != std::string::npos, "size error names the key: " + err);
  expect(!spyio::parse_config(R"({"memfile": {"max_memory": -3}})", c, &err), "negative number fails");
  expect(err.find("memfile.max_memory") != std::string::npos, "nested key in error: " + err);
  expect(!spyio::parse_config(R"({"chunk_size": 0})", c, &err), "zero chunk fails");
  expect(!spyio::parse_config("[1,2]", c, &err), "non-object root fails");
  expect(!spyio::parse_config("{\"max_payload_size\": ", c, &err), "truncated json fails");
}

static void from_file() {
  auto dir = spyio_test::scratch_dir("config");
  const auto path = dir / "spyio.json";
  { std::ofstream(path) << R"({"max_payload_size": "1K", "on_limit": "abort"})"; }
  spyio::AppConfig c;
  std::string err;
  expect(spyio::load_config(path.string(), c, &err), "load_config: " + err);
  expect(c.max_payload_size == std::optional<std::uint64_t>(1024), "loaded limit");
  expect(!spyio::load_config((dir / "nope.json").string(), c, &err), "missing file fails");
  expect(err.find("nope.json") != std::string::npos, "missing file error names path");
  std::filesystem::remove_all(dir);
}

int main() {
  sizes();
  defaults();
  full_document();
  zero_or_null_limit_means_unbounded();
  errors_leave_config_untouched();
  from_file();
  return spyio_test::finish("config");
}
