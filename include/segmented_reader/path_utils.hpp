#pragma once
#include "segmented_reader/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sr {

struct FileInfo {
  std::string name;             // base name of the path
  std::uint64_t size = 0;       // bytes
  std::uint64_t size_hint = 0;  // ceil(size / segment_size); advisory only
};

// Metadata lookup. On failure returns std::nullopt and fills kind/err
// (FileNotFound or AccessError) when given.
std::optional<FileInfo> stat_file(const std::string& path,
                                  ErrorKind* kind = nullptr,
                                  std::string* err = nullptr);

// ceil(size / segment_size); 0 for an empty file.
std::uint64_t segment_count_hint(std::uint64_t size, std::size_t segment_size) noexcept;

std::string base_name(std::string_view path);

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Slug generation: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

bool is_slug_mode(std::string_view mode);

}
