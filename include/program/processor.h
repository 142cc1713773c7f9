#pragma once

#include "program/account_guard.h"
#include "program/decoder.h"
#include "program/input_region.h"
#include "program/instruction.h"
#include "program/status.h"
#include <optional>
#include <string>
#include <vector>

namespace chadbuffer {
namespace program {

/**
 * Outcome of one invocation as seen by the host
 */
struct InvocationResult {
  uint64_t status = STATUS_SUCCESS;
  std::optional<ProgramError> error;
  std::optional<BufferInstruction> executed;
  std::vector<std::string> logs;

  bool is_success() const { return status == STATUS_SUCCESS; }
};

/**
 * @brief Buffer account state machine
 *
 * validate() runs decoding, the account guard and instruction parsing and
 * yields either a ParsedInstruction or the rejecting error; execute() only
 * accepts a ParsedInstruction, so no effect can run on an unvalidated
 * invocation.
 *
 * Region is InputRegion (bounds-checked) or TrustedInput (unchecked).
 */
template <typename Region>
class BufferProcessor {
public:
  explicit BufferProcessor(Region region) : region_(region) {}

  InvocationResult process();

  ProgramResult<ParsedInstruction> validate() const;

  void execute(const ParsedInstruction &instruction, StatusReporter &reporter);

private:
  void apply(const InitInstruction &init);
  void apply(const AssignInstruction &assign);
  void apply(const WriteInstruction &write);
  void apply(const CloseInstruction &close);

  Region region_;
};

/// Bounds-checked invocation
InvocationResult process_instruction(InputRegion region);

/// Unchecked invocation; the host vouches for the region
InvocationResult process_instruction(TrustedInput input);

} // namespace program
} // namespace chadbuffer
