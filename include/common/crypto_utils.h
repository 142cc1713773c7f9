#pragma once

#include "common/types.h"
#include <cstdint>
#include <vector>

namespace chadbuffer {
namespace common {

/**
 * Hashing helpers backed by OpenSSL's EVP digest interface.
 * The client SDK uses these to checksum uploaded buffer contents.
 */
class CryptoUtils {
public:
  /**
   * Compute SHA256 hash of data
   */
  static Result<Hash> sha256(const uint8_t *data, size_t length);
  static Result<Hash> sha256(const std::vector<uint8_t> &data);
};

} // namespace common
} // namespace chadbuffer
