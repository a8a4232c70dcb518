#include "segmented_reader/segmented_reader.hpp"
#include "segmented_reader/file_source.hpp"
#include <algorithm>
#include <deque>
#include <utility>

namespace sr {

struct SegmentedReader::Impl {
  Config cfg;
  std::unique_ptr<ByteSource> source;

  // Chunks taken from the source but not yet emitted, in file order.
  std::deque<Chunk> buffered;
  std::size_t buffered_len = 0;

  bool initialized = false;
  bool ended = false;
  bool awaiting = false;
  bool emitted_completion = false;
  bool source_failed = false;
  bool error_delivered = false;
  bool closed = false;

  // Re-entrancy guard: stimuli arriving while a pass runs are folded into it.
  bool running = false;
  bool rerun = false;

  std::uint64_t segments = 0;
  std::uint64_t bytes = 0;

  ErrorKind kind = ErrorKind::None;
  std::string err;

  explicit Impl(Config c) : cfg(std::move(c)) {}

  bool terminal() const noexcept {
    return emitted_completion || error_delivered || closed;
  }

  // Every stimulus (pull, data available, ended, error) lands here.
  void step() {
    if (running) { rerun = true; return; }
    // Cleared on every exit, including a throwing sink.
    struct RunningGuard {
      Impl* self;
      ~RunningGuard() { self->running = false; self->rerun = false; }
    } guard{this};
    running = true;
    do {
      rerun = false;
      drain_and_emit();
    } while (rerun && !terminal());
  }

  void drain_and_emit() {
    if (!awaiting || terminal() || !source) return;
    if (source_failed) { deliver_error(); return; }

    // Drain everything the source holds, including after on_ended: it may
    // still be sitting on chunks it produced before signalling the end.
    while (auto c = source->try_take()) {
      if (c->empty()) continue;
      buffered_len += c->size();
      buffered.push_back(std::move(*c));
    }

    if (buffered_len < cfg.segment_size && !ended) return;

    SegmentEvent ev;
    ev.index = segments;
    ev.offset = bytes;
    if (buffered_len > 0) ev.data = take_front(cfg.segment_size);

    ev.complete = ended && buffered_len == 0;
    awaiting = false;
    ++segments;
    bytes += ev.data.size();
    if (ev.complete) {
      emitted_completion = true;
      source->close();
    }
    cfg.sink(ev);
  }

  // Remove up to n bytes from the head of `buffered` as one contiguous chunk.
  Chunk take_front(std::size_t n) {
    if (buffered.front().size() == n || (buffered.size() == 1 && buffered.front().size() < n)) {
      Chunk out = std::move(buffered.front());
      buffered.pop_front();
      buffered_len -= out.size();
      return out;
    }
    Chunk out;
    out.reserve(std::min(n, buffered_len));
    while (!buffered.empty() && out.size() < n) {
      Chunk& head = buffered.front();
      std::size_t want = n - out.size();
      if (head.size() <= want) {
        out.insert(out.end(), head.begin(), head.end());
        buffered.pop_front();
      } else {
        out.insert(out.end(), head.begin(), head.begin() + static_cast<std::ptrdiff_t>(want));
        head.erase(head.begin(), head.begin() + static_cast<std::ptrdiff_t>(want));
      }
    }
    buffered_len -= out.size();
    return out;
  }

  void deliver_error() {
    SegmentEvent ev;
    ev.index = segments;
    ev.offset = bytes;
    ev.error = err;
    awaiting = false;
    error_delivered = true;
    source->close();
    cfg.sink(ev);
  }

  void on_data_available() { step(); }

  void on_ended() {
    ended = true;
    step();
  }

  void on_error(const std::string& msg) {
    if (source_failed || terminal()) return;
    source_failed = true;
    kind = ErrorKind::SourceError;
    err = msg;
    // Bytes after a fault can't be trusted to be contiguous; drop them.
    buffered.clear();
    buffered_len = 0;
    step();
  }

  bool open_source(const std::string& path) {
    if (cfg.open_source) {
      source = cfg.open_source(path);
      if (!source) {
        kind = ErrorKind::AccessError;
        err = "cannot open source for " + path;
        return false;
      }
      return true;
    }
    FileByteSource::Config fcfg;
    fcfg.chunk_bytes = cfg.read_chunk_bytes;
    fcfg.buffer_bytes = cfg.source_buffer_bytes;
    auto fs = std::make_unique<FileByteSource>(path, fcfg);
    if (!fs->open()) {
      kind = ErrorKind::AccessError;
      err = fs->last_error();
      return false;
    }
    source = std::move(fs);
    return true;
  }
};

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:         return "none";
    case ErrorKind::FileNotFound: return "file_not_found";
    case ErrorKind::AccessError:  return "access_error";
    case ErrorKind::SourceError:  return "source_error";
    case ErrorKind::State:        return "state";
  }
  return "unknown";
}

SegmentedReader::SegmentedReader(Config cfg) {
  if (cfg.file_path.empty()) throw ConfigError("file_path is required");
  if (!cfg.sink) throw ConfigError("sink callback is required");
  if (cfg.segment_size == 0) throw ConfigError("segment_size must be positive");
  if (cfg.read_chunk_bytes == 0) throw ConfigError("read_chunk_bytes must be positive");
  if (cfg.source_buffer_bytes < cfg.read_chunk_bytes)
    throw ConfigError("source_buffer_bytes must be >= read_chunk_bytes");
  p_ = new Impl(std::move(cfg));
}

SegmentedReader::~SegmentedReader() {
  if (p_->source) p_->source->close();
  delete p_;
}

std::optional<FileInfo> SegmentedReader::initialize() {
  if (p_->initialized || p_->closed) {
    p_->kind = ErrorKind::State;
    p_->err = "initialize() called twice";
    return std::nullopt;
  }
  p_->initialized = true;

  auto info = stat_file(p_->cfg.file_path, &p_->kind, &p_->err);
  if (!info) return std::nullopt;
  info->size_hint = segment_count_hint(info->size, p_->cfg.segment_size);

  if (!p_->open_source(p_->cfg.file_path)) {
    p_->source.reset();
    return std::nullopt;
  }

  ByteSource::Handlers h;
  h.on_data_available = [this]{ p_->on_data_available(); };
  h.on_ended = [this]{ p_->on_ended(); };
  h.on_error = [this](const std::string& m){ p_->on_error(m); };
  p_->source->set_handlers(std::move(h));

  p_->kind = ErrorKind::None;
  p_->err.clear();
  return info;
}

void SegmentedReader::pull() {
  if (!p_->source || p_->terminal()) return;
  p_->awaiting = true;
  p_->step();
}

bool SegmentedReader::poll() {
  if (!p_->source || p_->terminal()) return false;
  return p_->source->pump();
}

void SegmentedReader::close() {
  if (p_->closed) return;
  p_->closed = true;
  p_->awaiting = false;
  if (p_->source) p_->source->close();
  p_->buffered.clear();
  p_->buffered_len = 0;
}

bool SegmentedReader::finished() const noexcept {
  return p_->emitted_completion || p_->error_delivered;
}
bool SegmentedReader::failed() const noexcept { return p_->source_failed; }
bool SegmentedReader::awaiting_pull() const noexcept { return p_->awaiting; }
std::size_t SegmentedReader::buffered_bytes() const noexcept { return p_->buffered_len; }
std::size_t SegmentedReader::segment_size() const noexcept { return p_->cfg.segment_size; }
std::uint64_t SegmentedReader::segments_emitted() const noexcept { return p_->segments; }
std::uint64_t SegmentedReader::bytes_emitted() const noexcept { return p_->bytes; }
ErrorKind SegmentedReader::error_kind() const noexcept { return p_->kind; }
const std::string& SegmentedReader::last_error() const noexcept { return p_->err; }

}
