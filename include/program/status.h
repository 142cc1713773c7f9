#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chadbuffer {
namespace program {

/// Host-visible status codes; the taxonomy is binary
constexpr uint64_t STATUS_SUCCESS = 0;
constexpr uint64_t STATUS_FAILURE = 1;

/**
 * Reasons an invocation is rejected. Every one of them is reported with a
 * single log line and STATUS_FAILURE, before any account memory is touched.
 */
enum class ProgramError {
  WrongAccountCount,
  MissingSigner,
  InvalidAuthority,
  InvalidInstruction,
  RegionOutOfBounds
};

/// Log line emitted for an error ("Missing signer", "Invalid IX", ...)
const char *error_message(ProgramError error);

/// Stable identifier for structured logs ("missing_signer", ...)
const char *error_code(ProgramError error);

/**
 * Either a validated value or the error that stopped validation.
 * Effects only ever receive the value alternative.
 */
template <typename T>
using ProgramResult = std::variant<T, ProgramError>;

template <typename T>
bool is_error(const ProgramResult<T> &result) {
  return std::holds_alternative<ProgramError>(result);
}

/**
 * @brief Collects the program log and the status code of one invocation
 *
 * Each line is also forwarded to the global Logger under the "program"
 * module. Success is the default; only fail() changes the status.
 */
class StatusReporter {
public:
  void log(const std::string &line);
  void fail(ProgramError error);

  uint64_t status() const { return status_; }
  bool failed() const { return status_ != STATUS_SUCCESS; }
  std::optional<ProgramError> error() const { return error_; }
  const std::vector<std::string> &lines() const { return lines_; }
  std::vector<std::string> take_lines() { return std::move(lines_); }

private:
  uint64_t status_ = STATUS_SUCCESS;
  std::optional<ProgramError> error_;
  std::vector<std::string> lines_;
};

} // namespace program
} // namespace chadbuffer
