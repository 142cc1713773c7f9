#include "program/processor.h"
#include "common/logging.h"
#include <cstring>

namespace chadbuffer {
namespace program {

template <typename Region>
InvocationResult BufferProcessor<Region>::process() {
  StatusReporter reporter;
  InvocationResult result;

  auto validated = validate();
  if (is_error(validated)) {
    reporter.fail(std::get<ProgramError>(validated));
  } else {
    const auto &instruction = std::get<ParsedInstruction>(validated);
    execute(instruction, reporter);
    result.executed = kind_of(instruction);
  }

  result.status = reporter.status();
  result.error = reporter.error();
  result.logs = reporter.take_lines();
  return result;
}

template <typename Region>
ProgramResult<ParsedInstruction> BufferProcessor<Region>::validate() const {
  // 1. Account checks; nothing past the header is trusted until these pass
  AccountsHeader header = LayoutDecoder<Region>::decode_accounts(region_);
  if (auto error = AccountGuard::check_accounts(header)) {
    return *error;
  }

  // 2. Instruction block position, length and discriminator
  auto frame_result = LayoutDecoder<Region>::decode_instruction(region_);
  if (is_error(frame_result)) {
    return std::get<ProgramError>(frame_result);
  }
  const auto &frame = std::get<InstructionFrame>(frame_result);

  // 3. Authority gate for everything except Init
  if (auto error = AccountGuard::check_authority(region_, frame.discriminator)) {
    return *error;
  }

  return parse_instruction(region_, frame);
}

template <typename Region>
void BufferProcessor<Region>::execute(const ParsedInstruction &instruction,
                                      StatusReporter &reporter) {
  reporter.log(instruction_name(kind_of(instruction)));
  std::visit([this](const auto &ix) { apply(ix); }, instruction);
}

template <typename Region>
void BufferProcessor<Region>::apply(const InitInstruction &init) {
  std::memmove(region_.at_mut(InputLayout::BUFFER_AUTH),
               region_.at(InputLayout::SIGNER_KEY), PUBKEY_LENGTH);
  std::memmove(region_.at_mut(InputLayout::BUFFER_DATA),
               region_.at(init.data_offset), init.data_length);
}

template <typename Region>
void BufferProcessor<Region>::apply(const AssignInstruction &assign) {
  std::memmove(region_.at_mut(InputLayout::BUFFER_AUTH),
               region_.at(assign.authority_offset), PUBKEY_LENGTH);
}

template <typename Region>
void BufferProcessor<Region>::apply(const WriteInstruction &write) {
  LOG_DEBUG("program", "write ", write.data_length, " bytes at offset ",
            write.buffer_offset);
  std::memmove(region_.at_mut(write.destination_offset),
               region_.at(write.data_offset), write.data_length);
}

template <typename Region>
void BufferProcessor<Region>::apply(const CloseInstruction &) {
  uint64_t buffer_lamports = region_.read_u64(InputLayout::BUFFER_LAMPORTS);
  uint64_t signer_lamports = region_.read_u64(InputLayout::SIGNER_LAMPORTS);

  region_.write_u64(InputLayout::SIGNER_LAMPORTS, signer_lamports + buffer_lamports);
  region_.write_u64(InputLayout::BUFFER_LAMPORTS, 0);
  region_.write_u64(InputLayout::BUFFER_SIZE, 0);

  // Hand the account back to the system program (all-zero owner)
  write_zeroes_volatile(region_.at_mut(InputLayout::BUFFER_OWNER), PUBKEY_LENGTH);
}

template class BufferProcessor<InputRegion>;
template class BufferProcessor<TrustedInput>;

InvocationResult process_instruction(InputRegion region) {
  return BufferProcessor<InputRegion>(region).process();
}

InvocationResult process_instruction(TrustedInput input) {
  return BufferProcessor<TrustedInput>(input).process();
}

} // namespace program
} // namespace chadbuffer
