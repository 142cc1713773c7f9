#include "program/decoder.h"
#include "common/logging.h"

namespace chadbuffer {
namespace program {

template <typename Region>
AccountsHeader LayoutDecoder<Region>::decode_accounts(const Region &region) {
  AccountsHeader header;
  header.account_count = region.read_u64(InputLayout::ACCOUNT_COUNT);
  header.signer_flags =
      AccountFlags::decode(region.read_u32(InputLayout::SIGNER_HEADER));
  return header;
}

template <typename Region>
ProgramResult<InstructionFrame>
LayoutDecoder<Region>::decode_instruction(const Region &region) {
  uint64_t stored_length = buffer_stored_length(region);

  // Stored length is caller controlled; reject lengths that cannot fit
  if (!region.contains(InputLayout::IX_MIN_OFFSET,
                       static_cast<size_t>(stored_length))) {
    return ProgramError::RegionOutOfBounds;
  }

  InstructionFrame frame;
  frame.length_offset = instruction_block_offset(region.base(), stored_length);

  size_t offset = frame.length_offset;
  if (!region.contains(offset, sizeof(uint64_t) + sizeof(uint8_t))) {
    return ProgramError::RegionOutOfBounds;
  }

  frame.instruction_length = region.read_u64(offset);
  offset += sizeof(uint64_t);

  // No discriminator byte present
  if (frame.instruction_length == 0) {
    return ProgramError::InvalidInstruction;
  }

  frame.discriminator = region.read_u8(offset);
  offset += sizeof(uint8_t);
  frame.payload_offset = offset;

  if (!region.contains(frame.payload_offset, frame.payload_length())) {
    return ProgramError::RegionOutOfBounds;
  }

  LOG_TRACE("program", "instruction block at 0x", std::hex, frame.length_offset,
            std::dec, " length=", frame.instruction_length,
            " discriminator=", static_cast<int>(frame.discriminator));
  return frame;
}

template class LayoutDecoder<InputRegion>;
template class LayoutDecoder<TrustedInput>;

} // namespace program
} // namespace chadbuffer
