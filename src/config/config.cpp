#include "spyio/config.hpp"
#include <cctype>
#include <cmath>
#include <iostream>
#include <system_error>
#include <utility>
#include <fast_float/fast_float.h>
#include <simdjson.h>

namespace spyio {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

// "", "B", "K", "KB", "KiB", ... -> multiplier; 0 if unknown.
static std::uint64_t unit_multiplier(std::string_view unit) {
  if (unit.empty() || ieq(unit, "b")) return 1;
  std::uint64_t m = 0;
  switch (std::toupper((unsigned char)unit.front())) {
    case 'K': m = 1ull << 10; break;
    case 'M': m = 1ull << 20; break;
    case 'G': m = 1ull << 30; break;
    case 'T': m = 1ull << 40; break;
    default: return 0;
  }
  unit.remove_prefix(1);
  if (unit.empty() || ieq(unit, "b") || ieq(unit, "ib")) return m;
  return 0;
}

std::optional<std::uint64_t> parse_size(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  double v;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr == s.data()) return std::nullopt;
  if (!std::isfinite(v) || v < 0.0) return std::nullopt;

  const std::uint64_t mult = unit_multiplier(trim(std::string_view(ptr, s.data() + s.size() - ptr)));
  if (mult == 0) return std::nullopt;

  const double bytes = v * static_cast<double>(mult);
  if (bytes >= 18446744073709551616.0) return std::nullopt; // 2^64
  return static_cast<std::uint64_t>(bytes);
}

namespace {

using simdjson::ondemand::json_type;

struct ConfigParser {
  AppConfig cfg;
  std::string where; // dotted key being read, for error messages
  std::string err;

  bool fail(const std::string& msg) { err = where + ": " + msg; return false; }

  bool read_size(simdjson::ondemand::value v, std::uint64_t& out) {
    switch (v.type().value()) {
      case json_type::number:
        out = std::uint64_t(v.get_uint64());
        return true;
      case json_type::string: {
        std::string_view s = v.get_string();
        auto parsed = parse_size(s);
        if (!parsed) return fail("not a size: \"" + std::string(s) + "\"");
        out = *parsed;
        return true;
      }
      default:
        return fail("expected a number or size string");
    }
  }

  bool read_string(simdjson::ondemand::value v, std::string& out) {
    if (v.type().value() != json_type::string) return fail("expected a string");
    out = std::string(std::string_view(v.get_string()));
    return true;
  }

  bool read_seconds(simdjson::ondemand::value v, int& out) {
    if (v.type().value() != json_type::number) return fail("expected seconds as a number");
    std::int64_t s = v.get_int64();
    if (s <= 0 || s > 86400) return fail("out of range: " + std::to_string(s));
    out = static_cast<int>(s);
    return true;
  }

  bool memfile(simdjson::ondemand::object obj) {
    for (auto field : obj) {
      std::string key(std::string_view(field.unescaped_key()));
      where = "memfile." + key;
      simdjson::ondemand::value v = field.value();
      if (key == "max_memory") {
        std::uint64_t n = 0;
        if (!read_size(v, n)) return false;
        cfg.memfile.max_memory = static_cast<std::size_t>(n);
      }
      else if (key == "tmpdir") { if (!read_string(v, cfg.memfile.tmpdir)) return false; }
      else if (key == "prefix") { if (!read_string(v, cfg.memfile.prefix)) return false; }
      else if (key == "suffix") { if (!read_string(v, cfg.memfile.suffix)) return false; }
      else std::cerr << "[config] ignoring unknown key " << where << "\n";
    }
    return true;
  }

  bool records(simdjson::ondemand::object obj) {
    for (auto field : obj) {
      std::string key(std::string_view(field.unescaped_key()));
      where = "records." + key;
      simdjson::ondemand::value v = field.value();
      if (key == "dir")         { if (!read_string(v, cfg.records.dir)) return false; }
      else if (key == "prefix") { if (!read_string(v, cfg.records.prefix)) return false; }
      else if (key == "suffix") { if (!read_string(v, cfg.records.suffix)) return false; }
      else std::cerr << "[config] ignoring unknown key " << where << "\n";
    }
    return true;
  }

  bool root(simdjson::ondemand::object obj) {
    for (auto field : obj) {
      std::string key(std::string_view(field.unescaped_key()));
      where = key;
      simdjson::ondemand::value v = field.value();
      if (key == "max_payload_size") {
        if (v.type().value() == json_type::null) { cfg.max_payload_size.reset(); continue; }
        std::uint64_t n = 0;
        if (!read_size(v, n)) return false;
        // 0 disables the cap, like a missing value
        if (n == 0) cfg.max_payload_size.reset();
        else cfg.max_payload_size = n;
      }
      else if (key == "memfile") {
        if (v.type().value() != json_type::object) return fail("expected an object");
        if (!memfile(v.get_object())) return false;
      }
      else if (key == "records") {
        if (v.type().value() != json_type::object) return fail("expected an object");
        if (!records(v.get_object())) return false;
      }
      else if (key == "chunk_size") {
        std::uint64_t n = 0;
        if (!read_size(v, n)) return false;
        if (n == 0) return fail("must be positive");
        cfg.chunk_size = static_cast<std::size_t>(n);
      }
      else if (key == "on_limit") {
        std::string s;
        if (!read_string(v, s)) return false;
        auto p = parse_limit_policy(s);
        if (!p) return fail("expected \"abort\" or \"passthrough\", got \"" + s + "\"");
        cfg.on_limit = *p;
      }
      else if (key == "connect_timeout_s") { if (!read_seconds(v, cfg.connect_timeout_s)) return false; }
      else if (key == "read_timeout_s")    { if (!read_seconds(v, cfg.read_timeout_s)) return false; }
      else std::cerr << "[config] ignoring unknown key " << key << "\n";
    }
    return true;
  }

  bool parse(simdjson::padded_string& json) {
    thread_local simdjson::ondemand::parser parser;
    try {
      auto doc = parser.iterate(json);
      if (doc.type().value() != json_type::object) { where = "<root>"; return fail("expected an object"); }
      return root(doc.get_object());
    } catch (const simdjson::simdjson_error& e) {
      if (where.empty()) where = "<root>";
      return fail(e.what());
    }
  }
};

}

bool parse_config(std::string_view json, AppConfig& out, std::string* err_out) {
  simdjson::padded_string padded(json);
  ConfigParser p;
  p.cfg = out;
  if (!p.parse(padded)) {
    if (err_out) *err_out = p.err;
    return false;
  }
  out = std::move(p.cfg);
  return true;
}

bool load_config(const std::string& path, AppConfig& out, std::string* err_out) {
  simdjson::padded_string json;
  auto error = simdjson::padded_string::load(path).get(json);
  if (error) {
    if (err_out) *err_out = path + ": " + simdjson::error_message(error);
    return false;
  }
  ConfigParser p;
  p.cfg = out;
  if (!p.parse(json)) {
    if (err_out) *err_out = path + ": " + p.err;
    return false;
  }
  out = std::move(p.cfg);
  return true;
}

}
