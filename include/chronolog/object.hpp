#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace chronolog {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

} // namespace chronolog
