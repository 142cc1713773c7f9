#include "program/layout.h"
#include <sstream>

namespace chadbuffer {
namespace program {

AccountFlags AccountFlags::decode(uint32_t raw) {
  AccountFlags flags;
  flags.dup_marker = static_cast<uint8_t>(raw & 0xff);
  flags.is_signer = static_cast<uint8_t>((raw >> 8) & 0xff);
  flags.is_writable = static_cast<uint8_t>((raw >> 16) & 0xff);
  flags.executable = static_cast<uint8_t>((raw >> 24) & 0xff);
  return flags;
}

uint32_t AccountFlags::encode() const {
  return static_cast<uint32_t>(dup_marker) |
         (static_cast<uint32_t>(is_signer) << 8) |
         (static_cast<uint32_t>(is_writable) << 16) |
         (static_cast<uint32_t>(executable) << 24);
}

std::string AccountFlags::describe() const {
  std::ostringstream oss;
  if (is_duplicate()) {
    oss << "dup(" << static_cast<int>(dup_marker) << ")";
  } else {
    oss << "nodup";
  }
  oss << (is_signer ? " signer" : "") << (is_writable ? " writable" : "")
      << (executable ? " executable" : "");
  return oss.str();
}

} // namespace program
} // namespace chadbuffer
