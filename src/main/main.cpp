#include "spyio/config.hpp"
#include "spyio/file_pool.hpp"
#include "spyio/http_capture.hpp"
#include "spyio/io_error.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct Cli {
  std::string config_path;
  std::string url;
  std::string path = "/";
  std::string max_size;   // overrides config when set
  std::string out_dir;    // overrides records.dir when set
};

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--url=", &c.url)) continue;
    if (eat("--path=", &c.path)) continue;
    if (eat("--max-size=", &c.max_size)) continue;
    if (eat("--out-dir=", &c.out_dir)) continue;
    if (a == "-h" || a == "--help") {
      std::cout <<
        "Usage: spyio-fetch --url=http://host[:port] [--path=/]\n"
        "                   [--config=FILE] [--max-size=SIZE] [--out-dir=DIR]\n";
      std::exit(0);
    }
    std::cerr << "[fetch] unknown argument: " << a << "\n";
  }
  return c;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (cli.url.empty()) {
    std::cerr << "[fetch] --url is required (see --help)\n";
    return 2;
  }

  spyio::AppConfig cfg;
  std::string err;
  if (!cli.config_path.empty() && !spyio::load_config(cli.config_path, cfg, &err)) {
    std::cerr << "[config] " << err << "\n";
    return 2;
  }
  if (!cli.max_size.empty()) {
    auto n = spyio::parse_size(cli.max_size);
    if (!n) { std::cerr << "[fetch] bad --max-size: " << cli.max_size << "\n"; return 2; }
    if (*n == 0) cfg.max_payload_size.reset();
    else cfg.max_payload_size = *n;
  }
  if (!cli.out_dir.empty()) cfg.records.dir = cli.out_dir;

  spyio::FilePool pool(cfg.records);
  std::unique_ptr<spyio::FileStream> out_file;
  try {
    out_file = pool.get_file();
  } catch (const spyio::IoError& e) {
    std::cerr << "[fetch] " << e.what() << "\n";
    return 2;
  }

  spyio::HttpCapture::Config hcfg;
  hcfg.base_url = cli.url;
  hcfg.max_payload_size = cfg.max_payload_size;
  hcfg.buffer = cfg.memfile;
  hcfg.on_limit = cfg.on_limit;
  hcfg.chunk_size = cfg.chunk_size;
  hcfg.connect_timeout_s = cfg.connect_timeout_s;
  hcfg.read_timeout_s = cfg.read_timeout_s;
  spyio::HttpCapture capture(hcfg);

  std::string write_err;
  auto on_body = [&](std::string_view piece) {
    try {
      out_file->write(piece);
      return true;
    } catch (const spyio::IoError& e) {
      write_err = e.what();
      return false;
    }
  };

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  spyio::CaptureResult res;
  const bool ok = capture.fetch(cli.path, on_body, res);
  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();

  try {
    out_file->close();
  } catch (const spyio::IoError& e) {
    std::cerr << "[fetch] " << e.what() << "\n";
    return 1;
  }

  if (!write_err.empty()) std::cerr << "[fetch] output: " << write_err << "\n";
  if (!ok) {
    std::cerr << "[fetch] failed: " << cli.url << cli.path << ": " << res.error << "\n";
    return res.limit_exceeded ? 3 : 1;
  }

  std::cout << "[fetch] ok: status=" << res.status
            << " bytes=" << res.bytes_seen
            << " wall_ms=" << wall_ms
            << " captured=" << (res.captured ? (res.in_memory ? "memory" : "disk") : "dropped")
            << (res.limit_exceeded ? " limit_exceeded" : "")
            << (res.sha256.empty() ? "" : " sha256=" + res.sha256)
            << " -> " << pool.last_path().string() << "\n";
  return 0;
}
