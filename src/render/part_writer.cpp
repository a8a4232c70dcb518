#include "segmented_reader/part_writer.hpp"
#include "segmented_reader/path_utils.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace sr {

PartWriter::PartWriter(std::string dir) : dir_(std::move(dir)) {}

std::string PartWriter::part_name(std::uint64_t index) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "part-%05llu.bin", static_cast<unsigned long long>(index));
  return buf;
}

bool PartWriter::write(std::uint64_t index, const std::vector<std::uint8_t>& data) {
  if (!dir_ready_) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) { err_ = "cannot create " + dir_ + ": " + ec.message(); return false; }
    dir_ready_ = true;
  }
  const auto path = std::filesystem::path(dir_) / part_name(index);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) { err_ = "failed to open " + path.string(); return false; }
  out.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
  if (!out) { err_ = "failed to write " + path.string(); return false; }
  ++parts_;
  return true;
}

bool write_manifest(const std::string& out_root,
                    const std::string& slug,
                    const std::string& file_name,
                    const std::string& json,
                    std::string* err_out) {
  const std::filesystem::path target =
      std::filesystem::path(out_root) / slug / file_name;
  if (!ensure_parent_dirs(target)) {
    if (err_out) *err_out = "failed to create " + target.parent_path().string();
    return false;
  }
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err_out) *err_out = "failed to write " + target.string();
    return false;
  }
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  if (!out) {
    if (err_out) *err_out = "failed to write " + target.string();
    return false;
  }
  return true;
}

}
