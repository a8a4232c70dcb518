#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sr {

// Writes segments as <dir>/part-00000.bin, part-00001.bin, ...
class PartWriter {
public:
  explicit PartWriter(std::string dir);

  bool write(std::uint64_t index, const std::vector<std::uint8_t>& data);

  static std::string part_name(std::uint64_t index);

  std::uint64_t parts_written() const noexcept { return parts_; }
  const std::string& last_error() const noexcept { return err_; }

private:
  std::string dir_;
  bool dir_ready_ = false;
  std::uint64_t parts_ = 0;
  std::string err_;
};

// Writes `json` to <out_root>/<slug>/<file_name>.
bool write_manifest(const std::string& out_root,
                    const std::string& slug,
                    const std::string& file_name,
                    const std::string& json,
                    std::string* err_out = nullptr);

}
