#pragma once
#include "segmented_reader/metrics.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sr {

struct ManifestSegment {
  std::uint64_t index = 0;
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  std::string sha256;
  bool complete = false;
};

struct ManifestPayload {
  // Input metadata
  std::string name;
  std::string path;
  std::uint64_t file_size = 0;
  std::uint64_t size_hint = 0;
  std::uint64_t segment_size = 0;

  // Outcome
  std::vector<ManifestSegment> segments;
  std::string file_sha256;
  bool complete = false;
  std::string error;   // empty unless the source failed mid-stream

  RunStats stats;
};

class ManifestWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const ManifestPayload& p);
};

}
