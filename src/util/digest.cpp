#include "spyio/digest.hpp"
#include "spyio/io_error.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace spyio {

struct Sha256::Impl {
  EVP_MD_CTX* ctx{nullptr};
  bool finalized{false};
};

Sha256::Sha256() : p_(new Impl) {
  p_->ctx = EVP_MD_CTX_new();
  if (!p_->ctx || EVP_DigestInit_ex(p_->ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(p_->ctx);
    delete p_;
    throw IoError("sha256: digest init failed");
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(p_->ctx);
  delete p_;
}

void Sha256::update(std::string_view data) {
  if (p_->finalized) throw IoError("sha256: update after hex_digest");
  if (EVP_DigestUpdate(p_->ctx, data.data(), data.size()) != 1)
    throw IoError("sha256: digest update failed");
}

std::string Sha256::hex_digest() {
  if (p_->finalized) throw IoError("sha256: hex_digest called twice");
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(p_->ctx, md, &len) != 1) throw IoError("sha256: digest final failed");
  p_->finalized = true;
  std::ostringstream o;
  for (unsigned int i = 0; i < len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  return o.str();
}

std::string sha256_hex(std::string_view data) {
  Sha256 h;
  h.update(data);
  return h.hex_digest();
}

}
