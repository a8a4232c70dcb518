#include "segmented_reader/digest.hpp"
#include "segmented_reader/path_utils.hpp"
#include "../support/scripted_source.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int main(){
  // FIPS 180-2 test vectors.
  if (sr::sha256_hex("abc") != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
    std::cerr << "[FAIL] sha256(abc)\n"; return 1;
  }
  if (sr::sha256_hex("") != "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") {
    std::cerr << "[FAIL] sha256(empty)\n"; return 1;
  }
  sr::Sha256 h;
  h.update("a"); h.update("bc");
  if (h.hex_final() != sr::sha256_hex("abc")) { std::cerr << "[FAIL] incremental sha256\n"; return 1; }
  if (h.hex_final() != sr::sha256_hex("")) { std::cerr << "[FAIL] hasher not reset\n"; return 1; }

  const auto content = sr_test::pattern_bytes(5000, 11);
  const fs::path f = sr_test::temp_file_with("stat-me", content);
  sr::ErrorKind kind = sr::ErrorKind::State;
  std::string err;
  auto info = sr::stat_file(f.string(), &kind, &err);
  if (!info || info->name != "stat-me.bin" || info->size != 5000 || kind != sr::ErrorKind::None) {
    std::cerr << "[FAIL] stat_file on regular file: " << err << "\n"; return 1;
  }

  auto missing = sr::stat_file((f.parent_path() / "absent.bin").string(), &kind, &err);
  if (missing || kind != sr::ErrorKind::FileNotFound || err.empty()) {
    std::cerr << "[FAIL] stat_file on missing file\n"; return 1;
  }
  auto dir = sr::stat_file(f.parent_path().string(), &kind, &err);
  if (dir || kind != sr::ErrorKind::AccessError) {
    std::cerr << "[FAIL] stat_file on directory\n"; return 1;
  }

  if (sr::segment_count_hint(0, 10) != 0 || sr::segment_count_hint(10, 10) != 1 ||
      sr::segment_count_hint(11, 10) != 2 || sr::segment_count_hint(5, 0) != 0) {
    std::cerr << "[FAIL] segment_count_hint\n"; return 1;
  }

  if (sr::make_slug("/data/in/big.bin", "basename", 64) != "big.bin") { std::cerr << "[FAIL] basename slug\n"; return 1; }
  if (sr::make_slug("data/in/big.bin", "keypath", 64) != "data-in-big.bin") { std::cerr << "[FAIL] keypath slug\n"; return 1; }
  auto hp = sr::make_slug("data/in/big.bin", "hashprefix", 12);
  if (hp.size() != 12 || hp != sr::sha256_hex("data/in/big.bin").substr(0, 12)) {
    std::cerr << "[FAIL] hashprefix slug: " << hp << "\n"; return 1;
  }

  std::cout << "[PASS] path_utils digest+stat+slug\n";
  return 0;
}
