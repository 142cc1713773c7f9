#include "program/instruction.h"
#include "common/logging.h"

namespace chadbuffer {
namespace program {

const char *instruction_name(BufferInstruction instruction) {
  switch (instruction) {
  case BufferInstruction::Init:
    return "Init";
  case BufferInstruction::Assign:
    return "Assign";
  case BufferInstruction::Write:
    return "Write";
  case BufferInstruction::Close:
    return "Close";
  }
  return "Unknown";
}

BufferInstruction kind_of(const ParsedInstruction &instruction) {
  return static_cast<BufferInstruction>(instruction.index());
}

template <typename Region>
ProgramResult<ParsedInstruction> parse_instruction(const Region &region,
                                                   const InstructionFrame &frame) {
  const size_t payload_length = frame.payload_length();

  switch (frame.discriminator) {
  case static_cast<uint8_t>(BufferInstruction::Init): {
    InitInstruction init;
    init.data_offset = frame.payload_offset;
    init.data_length = payload_length;
    if (!region.contains(InputLayout::BUFFER_DATA, init.data_length)) {
      return ProgramError::RegionOutOfBounds;
    }
    return ParsedInstruction(init);
  }

  case static_cast<uint8_t>(BufferInstruction::Assign): {
    if (payload_length < PUBKEY_LENGTH) {
      LOG_DEBUG("program", "assign payload too short: ", payload_length);
      return ProgramError::InvalidInstruction;
    }
    AssignInstruction assign;
    assign.authority_offset = frame.payload_offset;
    return ParsedInstruction(assign);
  }

  case static_cast<uint8_t>(BufferInstruction::Write): {
    // 1 byte discriminator + 3 byte offset
    if (frame.instruction_length < sizeof(uint32_t)) {
      LOG_DEBUG("program", "write payload too short: ", payload_length);
      return ProgramError::InvalidInstruction;
    }
    WriteInstruction write;
    write.buffer_offset = region.read_u24(frame.payload_offset) & U24_MASK;
    write.destination_offset =
        InputLayout::BUFFER_DATA + static_cast<size_t>(write.buffer_offset);
    write.data_offset = frame.payload_offset + U24_LENGTH;
    write.data_length = payload_length - U24_LENGTH;
    if (!region.contains(write.destination_offset, write.data_length)) {
      return ProgramError::RegionOutOfBounds;
    }
    return ParsedInstruction(write);
  }

  case static_cast<uint8_t>(BufferInstruction::Close):
    return ParsedInstruction(CloseInstruction{});

  default:
    return ProgramError::InvalidInstruction;
  }
}

template ProgramResult<ParsedInstruction>
parse_instruction<InputRegion>(const InputRegion &, const InstructionFrame &);
template ProgramResult<ParsedInstruction>
parse_instruction<TrustedInput>(const TrustedInput &, const InstructionFrame &);

} // namespace program
} // namespace chadbuffer
