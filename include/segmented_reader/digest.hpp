#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sr {

// Incremental SHA-256 (OpenSSL EVP).
class Sha256 {
public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const void* data, std::size_t n);
  void update(std::string_view s) { update(s.data(), s.size()); }

  // Lowercase hex digest; the hasher is reset afterwards.
  std::string hex_final();

private:
  struct Impl; Impl* p_;
};

std::string sha256_hex(const void* data, std::size_t n);
std::string sha256_hex(std::string_view s);

}
