#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sr {

using Chunk = std::vector<std::uint8_t>;

// Pull-style producer with edge notifications. Chunks have arbitrary sizes.
//
// Contract:
//  - try_take() never blocks; std::nullopt means "nothing right now".
//  - on_data_available may fire spuriously.
//  - on_ended fires exactly once. Chunks may still be queued when it does;
//    they stay until taken.
//  - on_error fires at most once and is terminal; on_ended does not follow.
class ByteSource {
public:
  struct Handlers {
    std::function<void()> on_data_available;
    std::function<void()> on_ended;
    std::function<void(const std::string&)> on_error;
  };

  virtual ~ByteSource() = default;

  virtual void set_handlers(Handlers h) = 0;
  virtual std::optional<Chunk> try_take() = 0;

  // One cooperative production step. Returns false when there is nothing
  // to do right now (queue full, ended, failed or closed).
  virtual bool pump() = 0;

  virtual void close() = 0;
};

}
