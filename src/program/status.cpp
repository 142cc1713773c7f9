#include "program/status.h"
#include "common/logging.h"

namespace chadbuffer {
namespace program {

const char *error_message(ProgramError error) {
  switch (error) {
  case ProgramError::WrongAccountCount:
    return "Wrong number of accounts";
  case ProgramError::MissingSigner:
    return "Missing signer";
  case ProgramError::InvalidAuthority:
    return "Invalid authority";
  case ProgramError::InvalidInstruction:
    return "Invalid IX";
  case ProgramError::RegionOutOfBounds:
    return "Instruction data out of bounds";
  }
  return "Unknown error";
}

const char *error_code(ProgramError error) {
  switch (error) {
  case ProgramError::WrongAccountCount:
    return "wrong_account_count";
  case ProgramError::MissingSigner:
    return "missing_signer";
  case ProgramError::InvalidAuthority:
    return "invalid_authority";
  case ProgramError::InvalidInstruction:
    return "invalid_instruction";
  case ProgramError::RegionOutOfBounds:
    return "region_out_of_bounds";
  }
  return "unknown";
}

void StatusReporter::log(const std::string &line) {
  LOG_INFO("program", line);
  lines_.push_back(line);
}

void StatusReporter::fail(ProgramError error) {
  const char *message = error_message(error);
  LOG_STRUCTURED(common::LogLevel::WARN, "program", message, error_code(error));
  lines_.emplace_back(message);
  status_ = STATUS_FAILURE;
  error_ = error;
}

} // namespace program
} // namespace chadbuffer
