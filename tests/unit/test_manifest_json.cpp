#include "segmented_reader/manifest.hpp"

#include <iostream>
#include <limits>
#include <simdjson.h>

int main(){
  sr::ManifestPayload p;
  p.name = "we\"ird\tname.bin";
  p.path = "C:\\tmp\\x.bin";
  p.file_size = 5;
  p.size_hint = 2;
  p.segment_size = 4;
  p.segments.push_back({0, 0, 4, "aa", false});
  p.segments.push_back({1, 4, 1, "bb", true});
  p.complete = true;
  p.file_sha256 = "cc";
  p.stats.segments = 2;
  p.stats.bytes = 5;
  p.stats.wall_time_ms = std::numeric_limits<double>::infinity();
  p.stats.stages.push_back({"read", 1.5});

  const std::string json = sr::ManifestWriter::to_json(p);

  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    auto doc = parser.iterate(padded);

    std::string_view name = doc["name"].get_string().value();
    std::string_view path = doc["path"].get_string().value();
    if (name != "we\"ird\tname.bin" || path != "C:\\tmp\\x.bin") {
      std::cerr << "[FAIL] string escaping\n"; return 1;
    }
    if (doc["file_size"].get_uint64().value() != 5) { std::cerr << "[FAIL] file_size\n"; return 1; }
    if (!bool(doc["complete"].get_bool().value())) { std::cerr << "[FAIL] complete\n"; return 1; }

    std::uint64_t total = 0, completes = 0, count = 0;
    for (auto seg : doc["segments"].get_array()) {
      total += seg["length"].get_uint64().value();
      if (bool(seg["complete"].get_bool().value())) ++completes;
      ++count;
    }
    if (count != 2 || total != 5 || completes != 1) { std::cerr << "[FAIL] segments\n"; return 1; }

    double wall = doc["stats"]["wall_time_ms"].get_double().value();
    if (wall != 0.0) { std::cerr << "[FAIL] non-finite number not sanitized\n"; return 1; }
  } catch (const simdjson::simdjson_error& e) {
    std::cerr << "[FAIL] manifest is not valid JSON: " << e.what() << "\n" << json << "\n";
    return 1;
  }

  std::cout << "[PASS] manifest json\n";
  return 0;
}
