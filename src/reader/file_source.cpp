#include "segmented_reader/file_source.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <deque>
#include <utility>

namespace sr {

struct FileByteSource::Impl {
  std::string path;
  Config cfg;
  Handlers handlers;
  std::FILE* f = nullptr;
  std::deque<Chunk> queue;
  std::size_t queued = 0;
  std::uint64_t bytes = 0;
  bool eof = false;
  bool failed = false;
  bool closed = false;
  std::string err;

  void fail(const std::string& msg) {
    failed = true;
    err = msg;
    if (f) { std::fclose(f); f = nullptr; }
    if (handlers.on_error) handlers.on_error(err);
  }

  bool pump() {
    if (!f || eof || failed || closed) return false;
    if (queued >= cfg.buffer_bytes) return false;

    Chunk buf(cfg.chunk_bytes);
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0 && std::ferror(f)) {
      fail("read error on " + path + ": " + std::strerror(errno));
      return false;
    }
    if (n > 0) {
      buf.resize(n);
      bytes += n;
      queued += n;
      queue.push_back(std::move(buf));
      if (handlers.on_data_available) handlers.on_data_available();
    }
    // A short read is not end of file; only feof() says so.
    if (f && std::feof(f)) {
      eof = true;
      std::fclose(f); f = nullptr;
      if (handlers.on_ended) handlers.on_ended();
    }
    return true;
  }
};

FileByteSource::FileByteSource(std::string path)
  : FileByteSource(std::move(path), Config{}) {}

FileByteSource::FileByteSource(std::string path, Config cfg)
  : p_(new Impl{}) {
  p_->path = std::move(path);
  p_->cfg = cfg;
}

FileByteSource::~FileByteSource() {
  if (p_->f) std::fclose(p_->f);
  delete p_;
}

bool FileByteSource::open() {
  if (p_->f) return true;
  p_->f = std::fopen(p_->path.c_str(), "rb");
  if (!p_->f) {
    p_->err = "cannot open " + p_->path + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

void FileByteSource::set_handlers(Handlers h) { p_->handlers = std::move(h); }

std::optional<Chunk> FileByteSource::try_take() {
  if (p_->queue.empty()) return std::nullopt;
  Chunk c = std::move(p_->queue.front());
  p_->queue.pop_front();
  p_->queued -= c.size();
  return c;
}

bool FileByteSource::pump() { return p_->pump(); }

void FileByteSource::close() {
  p_->closed = true;
  if (p_->f) { std::fclose(p_->f); p_->f = nullptr; }
  p_->queue.clear();
  p_->queued = 0;
}

bool FileByteSource::ended() const noexcept { return p_->eof; }
bool FileByteSource::failed() const noexcept { return p_->failed; }
std::size_t FileByteSource::queued_bytes() const noexcept { return p_->queued; }
std::uint64_t FileByteSource::bytes_read() const noexcept { return p_->bytes; }
const std::string& FileByteSource::last_error() const noexcept { return p_->err; }

}
