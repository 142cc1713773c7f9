#pragma once

#include "program/input_region.h"
#include "program/layout.h"
#include "program/status.h"
#include <cstdint>

namespace chadbuffer {
namespace program {

/**
 * Fields readable before the account count has been validated.
 */
struct AccountsHeader {
  uint64_t account_count = 0;
  AccountFlags signer_flags;
};

/**
 * Location of the instruction block. `instruction_length` is the host's
 * length scalar and counts the discriminator byte.
 */
struct InstructionFrame {
  size_t length_offset = 0;
  uint64_t instruction_length = 0;
  uint8_t discriminator = 0;
  size_t payload_offset = 0;

  size_t payload_length() const {
    return static_cast<size_t>(instruction_length) - sizeof(uint8_t);
  }
};

/**
 * Decodes the input region in two phases. decode_instruction() depends on
 * the buffer's stored length, whose offset is only meaningful once the
 * account count has been checked, so callers must run the account guard
 * between the two.
 *
 * Region is InputRegion (bounds-checked) or TrustedInput (unchecked).
 */
template <typename Region>
class LayoutDecoder {
public:
  static AccountsHeader decode_accounts(const Region &region);

  static ProgramResult<InstructionFrame> decode_instruction(const Region &region);

  static const uint8_t *signer_key(const Region &region) {
    return region.at(InputLayout::SIGNER_KEY);
  }

  static const uint8_t *buffer_authority(const Region &region) {
    return region.at(InputLayout::BUFFER_AUTH);
  }

  static uint64_t buffer_stored_length(const Region &region) {
    return region.read_u64(InputLayout::BUFFER_SIZE);
  }
};

} // namespace program
} // namespace chadbuffer
