#pragma once
#include <stdexcept>
#include <string>

namespace sr {

enum class ErrorKind {
  None,
  FileNotFound,   // stat failed: path does not exist
  AccessError,    // exists but not a readable regular file, or open failed
  SourceError,    // read fault after the source was opened
  State           // call made in the wrong lifecycle state
};

const char* to_string(ErrorKind k) noexcept;

// Thrown by constructors for malformed arguments; nothing has been opened.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string& what)
    : std::invalid_argument("[config] " + what) {}
};

}
