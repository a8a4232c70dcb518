#include "segmented_reader/digest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sr {

struct Sha256::Impl {
  EVP_MD_CTX* ctx = nullptr;

  void init() {
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1)
      throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
};

Sha256::Sha256() : p_(new Impl) {
  p_->ctx = EVP_MD_CTX_new();
  if (!p_->ctx) { delete p_; throw std::runtime_error("EVP_MD_CTX_new failed"); }
  try {
    p_->init();
  } catch (const std::exception&) {
    EVP_MD_CTX_free(p_->ctx);
    delete p_;
    throw;
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(p_->ctx);
  delete p_;
}

void Sha256::update(const void* data, std::size_t n) {
  if (n == 0) return;
  if (EVP_DigestUpdate(p_->ctx, data, n) != 1)
    throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Sha256::hex_final() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(p_->ctx, md, &len) != 1)
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  std::ostringstream o;
  for (unsigned int i = 0; i < len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  p_->init();
  return o.str();
}

std::string sha256_hex(const void* data, std::size_t n) {
  Sha256 h;
  h.update(data, n);
  return h.hex_final();
}

std::string sha256_hex(std::string_view s) { return sha256_hex(s.data(), s.size()); }

}
