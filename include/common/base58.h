#pragma once

#include "common/types.h"
#include <string>
#include <vector>

namespace chadbuffer {
namespace common {

/**
 * Base58 codec (Bitcoin alphabet) used for human-readable account
 * addresses. Leading '1' characters correspond to leading zero bytes.
 */
std::string encode_base58(const std::vector<uint8_t> &data);

Result<std::vector<uint8_t>> decode_base58(const std::string &encoded);

/// Decode an address and require it to be exactly PUBKEY_BYTES long
Result<PublicKey> pubkey_from_base58(const std::string &encoded);

} // namespace common
} // namespace chadbuffer
