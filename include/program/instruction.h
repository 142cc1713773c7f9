#pragma once

#include "program/decoder.h"
#include "program/status.h"
#include <cstdint>
#include <variant>

namespace chadbuffer {
namespace program {

/**
 * Instruction discriminators:
 *
 * 0 - Init    payload: initial buffer contents
 * 1 - Assign  payload: new authority (32 bytes)
 * 2 - Write   payload: u24 offset + bytes to splice in
 * 3 - Close   no payload
 */
enum class BufferInstruction : uint8_t {
  Init = 0,
  Assign = 1,
  Write = 2,
  Close = 3
};

const char *instruction_name(BufferInstruction instruction);

/// Offsets below are absolute offsets into the input region
struct InitInstruction {
  size_t data_offset = 0;
  size_t data_length = 0;
};

struct AssignInstruction {
  size_t authority_offset = 0;
};

struct WriteInstruction {
  uint64_t buffer_offset = 0;   ///< relative to the buffer data start
  size_t destination_offset = 0;
  size_t data_offset = 0;
  size_t data_length = 0;
};

struct CloseInstruction {};

using ParsedInstruction = std::variant<InitInstruction, AssignInstruction,
                                       WriteInstruction, CloseInstruction>;

BufferInstruction kind_of(const ParsedInstruction &instruction);

/**
 * Turns a decoded frame into a typed instruction. All source and
 * destination ranges are checked against the region here, so executing the
 * result cannot fail. Destinations are deliberately not checked against the
 * buffer's stored length.
 */
template <typename Region>
ProgramResult<ParsedInstruction> parse_instruction(const Region &region,
                                                   const InstructionFrame &frame);

} // namespace program
} // namespace chadbuffer
