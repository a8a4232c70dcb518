#pragma once
#include "segmented_reader/byte_source.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace sr {

// ByteSource over a regular file. Each pump() reads at most chunk_bytes;
// reading stops while buffer_bytes or more are queued and not yet taken.
class FileByteSource : public ByteSource {
public:
  struct Config {
    std::size_t chunk_bytes  = 64 * 1024;   // per read(2)-sized step
    std::size_t buffer_bytes = 1024 * 1024; // high-water mark for the queue
  };

  explicit FileByteSource(std::string path);
  FileByteSource(std::string path, Config cfg);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  // Opens the file; false + last_error() on failure.
  bool open();

  void set_handlers(Handlers h) override;
  std::optional<Chunk> try_take() override;
  bool pump() override;
  void close() override;

  bool ended() const noexcept;
  bool failed() const noexcept;
  std::size_t queued_bytes() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  const std::string& last_error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
