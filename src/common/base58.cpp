#include "common/base58.h"
#include <algorithm>
#include <array>

namespace chadbuffer {
namespace common {

namespace {

const char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const std::array<int, 256> &base58_map() {
  static const std::array<int, 256> map = [] {
    std::array<int, 256> m{};
    m.fill(-1);
    for (int i = 0; i < 58; ++i) {
      m[static_cast<unsigned char>(BASE58_ALPHABET[i])] = i;
    }
    return m;
  }();
  return map;
}

} // namespace

std::string encode_base58(const std::vector<uint8_t> &data) {
  if (data.empty())
    return "";

  // Little-endian base 58 digits of the big-endian input number
  std::vector<uint8_t> digits;
  for (uint8_t byte : data) {
    uint32_t carry = byte;
    for (size_t i = 0; i < digits.size(); ++i) {
      carry += static_cast<uint32_t>(digits[i]) * 256;
      digits[i] = carry % 58;
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(carry % 58);
      carry /= 58;
    }
  }

  size_t leading_zeros = 0;
  while (leading_zeros < data.size() && data[leading_zeros] == 0) {
    leading_zeros++;
  }

  std::string result(leading_zeros, BASE58_ALPHABET[0]);
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result += BASE58_ALPHABET[*it];
  }
  return result;
}

Result<std::vector<uint8_t>> decode_base58(const std::string &encoded) {
  const auto &map = base58_map();

  // Little-endian base 256 bytes of the number
  std::vector<uint8_t> bytes;
  for (char c : encoded) {
    int digit = map[static_cast<unsigned char>(c)];
    if (digit < 0) {
      return Result<std::vector<uint8_t>>(
          std::string("Invalid base58 character '") + c + "'");
    }

    uint32_t carry = static_cast<uint32_t>(digit);
    for (size_t j = 0; j < bytes.size(); ++j) {
      carry += static_cast<uint32_t>(bytes[j]) * 58;
      bytes[j] = carry & 0xFF;
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(carry & 0xFF);
      carry >>= 8;
    }
  }

  size_t leading_ones = 0;
  while (leading_ones < encoded.size() &&
         encoded[leading_ones] == BASE58_ALPHABET[0]) {
    leading_ones++;
  }

  std::reverse(bytes.begin(), bytes.end());
  bytes.insert(bytes.begin(), leading_ones, 0);
  return Result<std::vector<uint8_t>>(std::move(bytes));
}

Result<PublicKey> pubkey_from_base58(const std::string &encoded) {
  auto decoded = decode_base58(encoded);
  if (decoded.is_err()) {
    return decoded;
  }
  if (decoded.value().size() != PUBKEY_BYTES) {
    return Result<PublicKey>("Address " + encoded + " decodes to " +
                             std::to_string(decoded.value().size()) +
                             " bytes, expected 32");
  }
  return decoded;
}

} // namespace common
} // namespace chadbuffer
