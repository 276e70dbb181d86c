#pragma once
#include <string>
#include <string_view>

namespace spyio {

// Incremental SHA-256 (OpenSSL EVP). Used to fingerprint captured payloads.
class Sha256 {
public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(std::string_view data);

  // Lowercase hex; finalizes, so call once.
  std::string hex_digest();

private:
  struct Impl; Impl* p_;
};

std::string sha256_hex(std::string_view data);

}
