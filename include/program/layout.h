#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace chadbuffer {
namespace program {

/**
 * @file layout.h
 * @brief Fixed offset table of the host-serialized input region
 *
 * The host serializes exactly two accounts (signer, buffer) followed by the
 * instruction block:
 *
 *   0x0000  account count (u64)
 *   0x0008  signer header: dup marker, is_signer, is_writable, executable
 *   0x0010  signer key, 0x0030 owner, 0x0050 lamports, 0x0058 data length
 *   0x0060  signer data (assumed empty) + realloc padding + rent epoch
 *   0x2868  buffer header, 0x2870 key, 0x2890 owner, 0x28b0 lamports,
 *   0x28b8  buffer stored length, 0x28c0 account data
 *   ...     account data + realloc padding, aligned, + rent epoch
 *           instruction length (u64), discriminator, payload, program id
 *
 * The buffer's account data begins with the 32-byte authority; the bytes
 * the program manages start right after it.
 */

/// Deployed address of the buffer program
constexpr const char *PROGRAM_ADDRESS = "bufzJtwkkoXEVh4eKFsshPFacLpgpxarasuDSvzGvxd";

constexpr size_t PUBKEY_LENGTH = 0x0020;
constexpr size_t ALIGNMENT = 0x0008;
constexpr size_t MAX_PERMITTED_DATA_INCREASE = 0x2800;
constexpr size_t RENT_EPOCH_LENGTH = sizeof(uint64_t);
constexpr uint8_t NON_DUP_MARKER = 0xff;
constexpr uint64_t EXPECTED_ACCOUNTS = 2;

/// Write offsets are 24-bit
constexpr uint64_t U24_MASK = 0xffffff;
constexpr size_t U24_LENGTH = 3;

struct InputLayout {
  static constexpr size_t ACCOUNT_COUNT = 0x0000;

  // Signer account record
  static constexpr size_t SIGNER_HEADER = 0x0008;
  static constexpr size_t SIGNER_KEY = 0x0010;
  static constexpr size_t SIGNER_OWNER = 0x0030;
  static constexpr size_t SIGNER_LAMPORTS = 0x0050;
  static constexpr size_t SIGNER_DATA_LEN = 0x0058;
  static constexpr size_t SIGNER_DATA = 0x0060;

  // Buffer account record
  static constexpr size_t BUFFER_HEADER = 0x2868;
  static constexpr size_t BUFFER_KEY = 0x2870;
  static constexpr size_t BUFFER_OWNER = 0x2890;
  static constexpr size_t BUFFER_LAMPORTS = 0x28b0;
  static constexpr size_t BUFFER_SIZE = 0x28b8;
  static constexpr size_t BUFFER_AUTH = 0x28c0;
  static constexpr size_t BUFFER_DATA = 0x28e0;

  // First possible instruction block offset (empty buffer account data)
  static constexpr size_t IX_MIN_OFFSET = 0x50c8;

  // Smallest region that can hold an empty buffer and a bare discriminator
  static constexpr size_t MIN_REGION_SIZE =
      IX_MIN_OFFSET + sizeof(uint64_t) + sizeof(uint8_t);
};

static_assert(InputLayout::SIGNER_DATA + MAX_PERMITTED_DATA_INCREASE +
                      RENT_EPOCH_LENGTH == InputLayout::BUFFER_HEADER,
              "buffer record must follow an empty signer account");
static_assert(InputLayout::BUFFER_AUTH + MAX_PERMITTED_DATA_INCREASE +
                      RENT_EPOCH_LENGTH == InputLayout::IX_MIN_OFFSET,
              "instruction block must follow an empty buffer account");
static_assert(InputLayout::BUFFER_DATA == InputLayout::BUFFER_AUTH + PUBKEY_LENGTH,
              "buffer data must follow the authority");

/// Bytes needed to advance `address` to the next ALIGNMENT boundary
inline size_t align_offset(uintptr_t address) {
  return static_cast<size_t>((ALIGNMENT - (address % ALIGNMENT)) % ALIGNMENT);
}

/**
 * Offset of the instruction length scalar, given the region base address and
 * the buffer's stored data length. The stored length is caller controlled
 * and unaligned, so the alignment step is computed on the absolute address.
 */
inline size_t instruction_block_offset(const uint8_t *base, uint64_t stored_length) {
  size_t offset = InputLayout::IX_MIN_OFFSET + static_cast<size_t>(stored_length);
  return offset + align_offset(reinterpret_cast<uintptr_t>(base) + offset);
}

/**
 * @brief Account header flags decoded from the 4-byte header word
 *
 * The required signer pattern (non-duplicate, signer, writable, not
 * executable) encodes to SIGNER_WRITABLE_NODUP.
 */
struct AccountFlags {
  static constexpr uint32_t SIGNER_WRITABLE_NODUP = 0x0101ff;

  uint8_t dup_marker = 0;
  uint8_t is_signer = 0;
  uint8_t is_writable = 0;
  uint8_t executable = 0;

  static AccountFlags decode(uint32_t raw);
  uint32_t encode() const;

  bool is_duplicate() const { return dup_marker != NON_DUP_MARKER; }

  /// Fresh (non-duplicate) mutable signer that is not a program account
  bool is_fresh_writable_signer() const {
    return !is_duplicate() && is_signer == 1 && is_writable == 1 &&
           executable == 0;
  }

  std::string describe() const;
};

} // namespace program
} // namespace chadbuffer
