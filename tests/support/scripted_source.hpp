#pragma once
#include "segmented_reader/byte_source.hpp"
#include "segmented_reader/segmented_reader.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace sr_test {

// ByteSource whose chunks, notifications and end are driven by the test.
class ScriptedByteSource : public sr::ByteSource {
public:
  void set_handlers(Handlers h) override { h_ = std::move(h); }

  std::optional<sr::Chunk> try_take() override {
    ++takes;
    if (queue_.empty()) return std::nullopt;
    sr::Chunk c = std::move(queue_.front());
    queue_.pop_front();
    return c;
  }

  // Production is scripted; pump() has nothing of its own to do.
  bool pump() override { return false; }

  void close() override { closed = true; queue_.clear(); }

  // Queue a chunk; optionally announce it.
  void push(sr::Chunk c, bool notify = true) {
    queue_.push_back(std::move(c));
    if (notify && h_.on_data_available) h_.on_data_available();
  }
  void notify() { if (h_.on_data_available) h_.on_data_available(); }
  void end() { if (h_.on_ended) h_.on_ended(); }
  void fail(const std::string& m) { if (h_.on_error) h_.on_error(m); }

  std::size_t queued() const {
    std::size_t n = 0;
    for (const auto& c : queue_) n += c.size();
    return n;
  }

  bool closed = false;
  std::uint64_t takes = 0;

private:
  Handlers h_;
  std::deque<sr::Chunk> queue_;
};

inline sr::Chunk pattern_bytes(std::size_t n, std::uint32_t seed = 7) {
  sr::Chunk out(n);
  std::mt19937 rng(seed);
  for (auto& b : out) b = static_cast<std::uint8_t>(rng() & 0xFF);
  return out;
}

inline std::filesystem::path temp_file_with(const std::string& tag, const sr::Chunk& bytes) {
  auto dir = std::filesystem::temp_directory_path() / "segmented-reader-tests";
  std::filesystem::create_directories(dir);
  auto p = dir / (tag + ".bin");
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  return p;
}

// Records every event the sink receives.
struct Recorder {
  std::vector<sr::SegmentEvent> events;

  sr::SegmentedReader::Sink sink() {
    return [this](const sr::SegmentEvent& ev){ events.push_back(ev); };
  }

  sr::Chunk joined() const {
    sr::Chunk all;
    for (const auto& e : events) all.insert(all.end(), e.data.begin(), e.data.end());
    return all;
  }

  std::size_t completes() const {
    std::size_t n = 0;
    for (const auto& e : events) if (e.complete) ++n;
    return n;
  }

  bool last_is_complete() const { return !events.empty() && events.back().complete; }
};

// Reader over a real file (for stat) whose bytes come from a ScriptedByteSource.
struct ScriptedSession {
  Recorder rec;
  ScriptedByteSource* src = nullptr;
  std::unique_ptr<sr::SegmentedReader> reader;
  std::optional<sr::FileInfo> info;

  ScriptedSession(const std::string& tag, const sr::Chunk& content, std::size_t segment_size) {
    auto path = temp_file_with(tag, content);
    sr::SegmentedReader::Config cfg;
    cfg.file_path = path.string();
    cfg.sink = rec.sink();
    cfg.segment_size = segment_size;
    cfg.open_source = [this](const std::string&) {
      auto s = std::make_unique<ScriptedByteSource>();
      src = s.get();
      return std::unique_ptr<sr::ByteSource>(std::move(s));
    };
    reader = std::make_unique<sr::SegmentedReader>(std::move(cfg));
    info = reader->initialize();
  }
};

}
