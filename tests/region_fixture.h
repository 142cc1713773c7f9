#pragma once

#include "program/layout.h"
#include "runtime/input_serializer.h"
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

inline std::vector<uint8_t> filled_key(uint8_t fill) {
  return std::vector<uint8_t>(32, fill);
}

inline std::vector<uint8_t> byte_range(const uint8_t *data, size_t length) {
  return std::vector<uint8_t>(data, data + length);
}

inline std::vector<uint8_t> le_bytes(uint64_t value, size_t width) {
  std::vector<uint8_t> out;
  for (size_t i = 0; i < width; ++i) {
    out.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
  return out;
}

// Builds serialized input regions for the signer + buffer invocation shape
// and reads fields back out of them by fixed offset.

inline chadbuffer::runtime::AccountState
make_signer(const std::vector<uint8_t> &key, uint64_t lamports = 1000000) {
  chadbuffer::runtime::AccountState account;
  account.key = key;
  account.lamports = lamports;
  account.is_signer = true;
  account.is_writable = true;
  return account;
}

// Buffer account data is the 32-byte authority followed by `contents`
inline chadbuffer::runtime::AccountState
make_buffer(const std::vector<uint8_t> &key, const std::vector<uint8_t> &authority,
            const std::vector<uint8_t> &contents, uint64_t lamports = 500000) {
  chadbuffer::runtime::AccountState account;
  account.key = key;
  account.owner = filled_key(0xb0);
  account.lamports = lamports;
  account.is_writable = true;
  account.data = authority;
  account.data.resize(32, 0);
  account.data.insert(account.data.end(), contents.begin(), contents.end());
  return account;
}

inline std::unique_ptr<chadbuffer::runtime::AlignedRegion>
build_region(const std::vector<chadbuffer::runtime::AccountState> &accounts,
             const std::vector<uint8_t> &instruction_data) {
  return chadbuffer::runtime::InputSerializer::serialize(accounts, instruction_data,
                                                         filled_key(0xb0));
}

inline uint64_t region_u64(const chadbuffer::runtime::AlignedRegion &region,
                           size_t offset) {
  uint64_t value;
  std::memcpy(&value, region.data() + offset, sizeof(value));
  return value;
}

inline std::vector<uint8_t> region_bytes(const chadbuffer::runtime::AlignedRegion &region,
                                         size_t offset, size_t length) {
  return byte_range(region.data() + offset, length);
}

inline std::vector<uint8_t> region_snapshot(const chadbuffer::runtime::AlignedRegion &region) {
  return byte_range(region.data(), region.size());
}
