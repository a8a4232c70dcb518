#include "segmented_reader/segmented_reader.hpp"
#include "segmented_reader/digest.hpp"
#include "segmented_reader/manifest.hpp"
#include "segmented_reader/metrics.hpp"
#include "segmented_reader/part_writer.hpp"
#include "segmented_reader/path_utils.hpp"
#include "segmented_reader/tool_config.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

enum ExitCode { kOk = 0, kUsage = 1, kNoFile = 2, kReadFailed = 3 };

struct Cli {
  std::string config_path;
  sr::ToolConfig cfg;
  std::vector<std::string> files;
};

void usage(std::ostream& os) {
  os <<
    "Usage: segmented-reader [--config=FILE] [--segment-size=SIZE] [--read-chunk=SIZE]\n"
    "                        [--source-buffer=SIZE] [--out-dir=DIR] [--write-parts]\n"
    "                        [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n"
    "                        FILE...\n"
    "SIZE accepts suffixes: k, KiB, KB, m, MiB, MB, g, GiB, GB\n";
}

// Returns false on a malformed command line; err says why.
bool parse_cli(int argc, char** argv, Cli& c, std::string& err) {
  // Config file first so flags override it regardless of order.
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) c.config_path = a.substr(9);
  }
  if (!c.config_path.empty() && !sr::load_config_file(c.config_path, c.cfg, &err))
    return false;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_size = [&](const char* pfx, std::size_t* out){
      if (a.rfind(pfx, 0) != 0) return false;
      auto v = sr::parse_size(a.substr(std::string(pfx).size()));
      if (!v) { err = "bad size in " + a; return true; }
      *out = static_cast<std::size_t>(*v);
      return true;
    };
    std::string ignored;
    if (eat("--config=", &ignored)) continue;
    if (eat_size("--segment-size=", &c.cfg.segment_size)) continue;
    if (eat_size("--read-chunk=", &c.cfg.read_chunk_bytes)) continue;
    if (eat_size("--source-buffer=", &c.cfg.source_buffer_bytes)) continue;
    if (eat("--out-dir=", &c.cfg.out_dir)) continue;
    if (eat("--slug-mode=", &c.cfg.slug_mode)) continue;
    if (a.rfind("--slug-len=", 0) == 0) {
      try { c.cfg.slug_len = std::stoi(a.substr(11)); }
      catch (const std::exception&) { err = "bad number in " + a; }
      continue;
    }
    if (a == "--write-parts") { c.cfg.write_parts = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { err = "unknown option: " + a; return false; }
    c.files.push_back(a);
  }
  if (!err.empty()) return false;
  if (c.files.empty()) { err = "no input files"; return false; }
  return sr::validate(c.cfg, &err);
}

int read_one_file(const std::string& filepath, const sr::ToolConfig& cfg) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  // For hashprefix mode, hash the absolute path so slugs are stable across cwd.
  std::string key = filepath;
  if (cfg.slug_mode == "hashprefix") {
    std::error_code ec;
    auto canon = std::filesystem::weakly_canonical(std::filesystem::path(filepath), ec);
    if (!ec) key = canon.string();
  }
  const std::string slug = sr::make_slug(key, cfg.slug_mode, cfg.slug_len);

  sr::MetricsRegistry metrics;
  sr::ManifestPayload manifest;
  sr::Sha256 whole;
  sr::PartWriter parts((std::filesystem::path(cfg.out_dir) / slug / "parts").string());

  bool ready = true;        // consumer side: wants the next segment
  std::string output_err;

  sr::SegmentedReader::Config rcfg;
  rcfg.file_path = filepath;
  rcfg.segment_size = cfg.segment_size;
  rcfg.read_chunk_bytes = cfg.read_chunk_bytes;
  rcfg.source_buffer_bytes = cfg.source_buffer_bytes;
  rcfg.sink = [&](const sr::SegmentEvent& ev) {
    if (ev.failed()) {
      manifest.error = ev.error;
      return;
    }
    metrics.add_segment(ev.data.size());
    whole.update(ev.data.data(), ev.data.size());

    sr::ManifestSegment seg;
    seg.index = ev.index;
    seg.offset = ev.offset;
    seg.length = ev.data.size();
    seg.sha256 = sr::sha256_hex(ev.data.data(), ev.data.size());
    seg.complete = ev.complete;
    manifest.segments.push_back(std::move(seg));
    manifest.complete = ev.complete;

    if (cfg.write_parts && !parts.write(ev.index, ev.data)) {
      output_err = parts.last_error();
      return;
    }
    ready = true;
  };

  sr::SegmentedReader reader(std::move(rcfg));

  metrics.start_stage("initialize");
  auto info = reader.initialize();
  metrics.end_stage("initialize");
  if (!info) {
    std::cerr << "[read] " << sr::to_string(reader.error_kind()) << ": "
              << reader.last_error() << "\n";
    return kNoFile;
  }

  metrics.start_stage("read");
  while (!reader.finished()) {
    if (!output_err.empty()) break;
    if (ready) {
      ready = false;
      metrics.add_pull();
      reader.pull();
      continue;
    }
    metrics.add_poll();
    if (!reader.poll() && !reader.finished()) {
      std::cerr << "[read] stalled: " << filepath << " buffered="
                << reader.buffered_bytes() << "\n";
      return kReadFailed;
    }
  }
  metrics.end_stage("read");
  reader.close();

  if (!output_err.empty()) {
    std::cerr << "[read] output error: " << output_err << "\n";
    return kReadFailed;
  }

  const double wall_ms =
      ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();

  manifest.name = info->name;
  manifest.path = filepath;
  manifest.file_size = info->size;
  manifest.size_hint = info->size_hint;
  manifest.segment_size = cfg.segment_size;
  manifest.file_sha256 = manifest.error.empty() ? whole.hex_final() : std::string();
  manifest.stats = metrics.snapshot(wall_ms);

  std::string err;
  if (!sr::write_manifest(cfg.out_dir, slug, cfg.manifest_name,
                          sr::ManifestWriter::to_json(manifest), &err)) {
    std::cerr << "[manifest] " << err << "\n";
    return kReadFailed;
  }

  if (!manifest.error.empty()) {
    std::cerr << "[read] source error: " << filepath << ": " << manifest.error << "\n";
    return kReadFailed;
  }

  std::cout << "[read] ok: " << filepath
            << " size=" << info->size
            << " segments=" << manifest.stats.segments
            << " hint=" << info->size_hint;
  if (cfg.write_parts) std::cout << " parts=" << parts.parts_written();
  std::cout << " -> " << (std::filesystem::path(cfg.out_dir) / slug / cfg.manifest_name).string()
            << "\n";
  return kOk;
}

}

int main(int argc, char** argv) {
  Cli cli;
  std::string err;
  if (!parse_cli(argc, argv, cli, err)) {
    std::cerr << "[config] " << err << "\n";
    usage(std::cerr);
    return kUsage;
  }

  int rc = kOk;
  for (const auto& f : cli.files) {
    int r = kOk;
    try {
      r = read_one_file(f, cli.cfg);
    } catch (const sr::ConfigError& e) {
      std::cerr << e.what() << "\n";
      r = kUsage;
    } catch (const std::exception& e) {
      std::cerr << "[read] " << f << ": " << e.what() << "\n";
      r = kReadFailed;
    }
    if (r > rc) rc = r;
  }
  return rc;
}
