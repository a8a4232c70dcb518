#include "segmented_reader/tool_config.hpp"
#include "segmented_reader/path_utils.hpp"

#include <simdjson.h>
#include <fast_float/fast_float.h>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <limits>

namespace sr {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static std::optional<double> unit_scale(std::string_view u) {
  if (u.empty() || ieq(u, "b")) return 1.0;
  static constexpr struct { std::string_view name; double scale; } units[] = {
    {"k", 1024.0},             {"kib", 1024.0},             {"kb", 1e3},
    {"m", 1024.0 * 1024.0},    {"mib", 1024.0 * 1024.0},    {"mb", 1e6},
    {"g", 1073741824.0},       {"gib", 1073741824.0},       {"gb", 1e9},
  };
  for (const auto& e : units) if (ieq(u, e.name)) return e.scale;
  return std::nullopt;
}

std::optional<std::uint64_t> parse_size(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  if (s.empty() || s.front() == '-' || s.front() == '+') return std::nullopt;

  double v = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr == s.data()) return std::nullopt;

  std::string_view unit(ptr, static_cast<std::size_t>(s.data() + s.size() - ptr));
  while (!unit.empty() && std::isspace((unsigned char)unit.front())) unit.remove_prefix(1);
  auto scale = unit_scale(unit);
  if (!scale) return std::nullopt;

  const double bytes = v * *scale;
  if (!std::isfinite(bytes) || bytes < 0.0) return std::nullopt;
  if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) return std::nullopt;
  if (bytes != std::floor(bytes)) return std::nullopt;
  return static_cast<std::uint64_t>(bytes);
}

// Sizes may be JSON integers or size strings.
static bool read_size(simdjson::ondemand::value& v, std::string_view key,
                      std::size_t& out, std::string* err) {
  auto t = v.type().value();
  if (t == simdjson::ondemand::json_type::number) {
    std::uint64_t n = 0;
    if (v.get_uint64().get(n) != simdjson::SUCCESS) {
      if (err) *err = std::string(key) + ": expected a non-negative integer";
      return false;
    }
    out = static_cast<std::size_t>(n);
    return true;
  }
  if (t == simdjson::ondemand::json_type::string) {
    std::string_view s = v.get_string().value();
    auto n = parse_size(s);
    if (!n) {
      if (err) *err = std::string(key) + ": bad size '" + std::string(s) + "'";
      return false;
    }
    out = static_cast<std::size_t>(*n);
    return true;
  }
  if (err) *err = std::string(key) + ": expected integer or size string";
  return false;
}

bool load_config_file(const std::string& path, ToolConfig& cfg, std::string* err) {
  if (!std::filesystem::exists(path)) {
    if (err) *err = "config file not found: " + path;
    return false;
  }

  try {
    simdjson::ondemand::parser parser;
    auto json = simdjson::padded_string::load(path);
    auto doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();

    for (auto field : obj) {
      std::string_view key = field.unescaped_key().value();
      simdjson::ondemand::value v = field.value();

      if (key == "segment_size") {
        if (!read_size(v, key, cfg.segment_size, err)) return false;
      } else if (key == "read_chunk_bytes") {
        if (!read_size(v, key, cfg.read_chunk_bytes, err)) return false;
      } else if (key == "source_buffer_bytes") {
        if (!read_size(v, key, cfg.source_buffer_bytes, err)) return false;
      } else if (key == "out_dir") {
        cfg.out_dir = std::string(v.get_string().value());
      } else if (key == "write_parts") {
        cfg.write_parts = bool(v.get_bool().value());
      } else if (key == "slug_mode") {
        cfg.slug_mode = std::string(v.get_string().value());
      } else if (key == "slug_len") {
        cfg.slug_len = static_cast<int>(v.get_int64().value());
      } else if (key == "manifest_name") {
        cfg.manifest_name = std::string(v.get_string().value());
      } else {
        if (err) *err = "unknown config key: " + std::string(key);
        return false;
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err) *err = path + ": " + e.what();
    return false;
  }
  return true;
}

bool validate(const ToolConfig& cfg, std::string* err) {
  auto fail = [&](const std::string& m){ if (err) *err = m; return false; };
  if (cfg.segment_size == 0)        return fail("segment_size must be positive");
  if (cfg.read_chunk_bytes == 0)    return fail("read_chunk_bytes must be positive");
  if (cfg.source_buffer_bytes < cfg.read_chunk_bytes)
    return fail("source_buffer_bytes must be >= read_chunk_bytes");
  if (!is_slug_mode(cfg.slug_mode)) return fail("unknown slug_mode: " + cfg.slug_mode);
  if (cfg.slug_len <= 0)            return fail("slug_len must be positive");
  if (cfg.out_dir.empty())          return fail("out_dir must not be empty");
  if (cfg.manifest_name.empty())    return fail("manifest_name must not be empty");
  return true;
}

}
