#include "segmented_reader/path_utils.hpp"
#include "segmented_reader/digest.hpp"
#include <cstdio>
#include <system_error>

namespace sr {

std::optional<FileInfo> stat_file(const std::string& path, ErrorKind* kind,
                                  std::string* err) {
  auto fail = [&](ErrorKind k, const std::string& msg) -> std::optional<FileInfo> {
    if (kind) *kind = k;
    if (err) *err = msg;
    return std::nullopt;
  };

  std::error_code ec;
  const std::filesystem::path p(path);
  auto st = std::filesystem::status(p, ec);
  if (ec || !std::filesystem::exists(st)) {
    if (ec && ec != std::errc::no_such_file_or_directory)
      return fail(ErrorKind::AccessError, "cannot stat " + path + ": " + ec.message());
    return fail(ErrorKind::FileNotFound, "file does not exist: " + path);
  }
  if (!std::filesystem::is_regular_file(st))
    return fail(ErrorKind::AccessError, "not a regular file: " + path);

  auto size = std::filesystem::file_size(p, ec);
  if (ec) return fail(ErrorKind::AccessError, "cannot size " + path + ": " + ec.message());

  // Readability is only known by trying.
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return fail(ErrorKind::AccessError, "cannot open " + path + " for reading");
  std::fclose(f);

  FileInfo info;
  info.name = base_name(path);
  info.size = static_cast<std::uint64_t>(size);
  if (kind) *kind = ErrorKind::None;
  return info;
}

std::uint64_t segment_count_hint(std::uint64_t size, std::size_t segment_size) noexcept {
  if (segment_size == 0) return 0;
  return (size + segment_size - 1) / segment_size;
}

std::string base_name(std::string_view path) {
  return std::filesystem::path(std::string(path)).filename().string();
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool is_slug_mode(std::string_view mode) {
  return mode == "hashprefix" || mode == "basename" || mode == "keypath";
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (mode == "basename") {
    auto base = base_name(key);
    if ((int)base.size() > len) base.resize(len);
    return base;
  }
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) if (c=='/' || c=='\\') c='-';
    if ((int)s.size() > len) s.resize(len);
    return s;
  }
  // default: hashprefix
  auto s = sha256_hex(key);
  if ((int)s.size() > len) s.resize(len);
  return s;
}

}
