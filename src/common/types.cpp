#include "common/types.h"
#include <iomanip>
#include <sstream>

namespace chadbuffer {
namespace common {

// Result types used across the core library
template class Result<bool>;
template class Result<std::vector<uint8_t>>;

std::string to_hex(const uint8_t *data, size_t length) {
  std::ostringstream oss;
  for (size_t i = 0; i < length; ++i) {
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string to_hex(const std::vector<uint8_t> &data) {
  return to_hex(data.data(), data.size());
}

} // namespace common
} // namespace chadbuffer
