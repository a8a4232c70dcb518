#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sr {

struct ToolConfig {
  std::size_t segment_size        = 2621440;
  std::size_t read_chunk_bytes    = 64 * 1024;
  std::size_t source_buffer_bytes = 1024 * 1024;
  std::string out_dir       = "artifacts/segmented-reader";
  bool        write_parts   = false;
  std::string slug_mode     = "hashprefix"; // hashprefix|basename|keypath
  int         slug_len      = 12;
  std::string manifest_name = "manifest.json";
};

// "4096", "64k", "2.5MiB", "1GB". K/M/G and KiB/MiB/GiB are powers of two,
// KB/MB/GB powers of ten. Fractions must resolve to a whole byte count.
std::optional<std::uint64_t> parse_size(std::string_view s);

// Merge a JSON object from `path` into `cfg`. Unknown keys are errors.
bool load_config_file(const std::string& path, ToolConfig& cfg, std::string* err);

bool validate(const ToolConfig& cfg, std::string* err);

}
