#pragma once
#include "segmented_reader/byte_source.hpp"
#include "segmented_reader/errors.hpp"
#include "segmented_reader/path_utils.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sr {

constexpr std::size_t kDefaultSegmentSize = 2621440; // 2.5 MiB

struct SegmentEvent {
  Chunk data;                 // may be empty on the final event
  bool complete = false;      // true exactly once, on the last event
  std::uint64_t index = 0;    // 0-based emission number
  std::uint64_t offset = 0;   // file offset of data[0]
  std::string error;          // set only on a terminal source failure

  bool failed() const noexcept { return !error.empty(); }
};

// Pull-driven segmenter. Emits fixed-size segments of a file to `sink`,
// one per pull(), never ahead of the consumer.
//
// Completion is decided only by (source ended && nothing buffered). The
// size hint returned by initialize() is informational.
class SegmentedReader {
public:
  using Sink = std::function<void(const SegmentEvent&)>;
  using SourceFactory =
      std::function<std::unique_ptr<ByteSource>(const std::string& path)>;

  struct Config {
    std::string file_path;
    Sink sink;
    std::size_t segment_size        = kDefaultSegmentSize;
    std::size_t read_chunk_bytes    = 64 * 1024;
    std::size_t source_buffer_bytes = 1024 * 1024;
    SourceFactory open_source;      // empty -> FileByteSource
  };

  // Throws ConfigError before any I/O.
  explicit SegmentedReader(Config cfg);
  ~SegmentedReader();

  SegmentedReader(const SegmentedReader&) = delete;
  SegmentedReader& operator=(const SegmentedReader&) = delete;

  // Stat + open. std::nullopt on failure, see error_kind()/last_error().
  std::optional<FileInfo> initialize();

  // Consumer is ready for the next segment.
  void pull();

  // Let the source make one step of progress.
  bool poll();

  // Releases the source; no further events.
  void close();

  bool finished() const noexcept;  // completion or error delivered
  bool failed() const noexcept;
  bool awaiting_pull() const noexcept;
  std::size_t buffered_bytes() const noexcept;
  std::size_t segment_size() const noexcept;
  std::uint64_t segments_emitted() const noexcept;
  std::uint64_t bytes_emitted() const noexcept;

  ErrorKind error_kind() const noexcept;
  const std::string& last_error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
