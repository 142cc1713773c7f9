#pragma once

#include "common/types.h"
#include "runtime/input_serializer.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chadbuffer {
namespace runtime {

using namespace chadbuffer::common;

/**
 * Host execution result
 */
enum class ExecutionResult {
  SUCCESS,
  PROGRAM_ERROR,
  ACCOUNT_NOT_FOUND,
  INSUFFICIENT_FUNDS,
  INVALID_INSTRUCTION,
  HOST_VIOLATION
};

const char *execution_result_name(ExecutionResult result);

struct ExecutionOutcome {
  ExecutionResult result = ExecutionResult::SUCCESS;
  uint64_t status_code = 0;         ///< program status word, 0 on success
  std::string error_details;
  std::vector<std::string> logs;    ///< program log lines, in order

  bool is_success() const { return result == ExecutionResult::SUCCESS; }
};

/**
 * @brief In-memory host for the buffer program
 *
 * Owns an account store and runs transactions against it the way a
 * validator would: serialize the referenced accounts, invoke the program,
 * read the region back and verify the changes before committing. Also
 * understands the two helper programs a buffer upload uses: system
 * create-account and the compute budget instructions.
 *
 * Transactions are atomic; any failure restores every touched account.
 * Not thread-safe.
 */
class BufferProgramHost {
public:
  static const PublicKey SYSTEM_PROGRAM_ID;
  static const PublicKey COMPUTE_BUDGET_PROGRAM_ID;

  static constexpr Lamports LAMPORTS_PER_BYTE_YEAR = 3480;
  static constexpr Lamports EXEMPTION_THRESHOLD_YEARS = 2;
  static constexpr size_t ACCOUNT_STORAGE_OVERHEAD = 128;

  explicit BufferProgramHost(const ProgramConfig &config = ProgramConfig(),
                             PublicKey program_id = PublicKey());

  const PublicKey &program_id() const { return program_id_; }
  const ProgramConfig &config() const { return config_; }

  /// Insert or replace an account
  void set_account(const AccountState &account);
  std::optional<AccountState> get_account(const PublicKey &key) const;
  bool account_exists(const PublicKey &key) const;
  Lamports balance(const PublicKey &key) const;

  static Lamports rent_exempt_minimum(size_t data_size);

  ExecutionOutcome execute(const Instruction &instruction);
  ExecutionOutcome execute_transaction(const std::vector<Instruction> &instructions);

  uint64_t transactions_processed() const { return transactions_processed_; }
  uint64_t transactions_failed() const { return transactions_failed_; }

private:
  using AccountStore = std::unordered_map<PublicKey, AccountState>;
  using UndoLog = std::unordered_map<PublicKey, std::optional<AccountState>>;

  ExecutionOutcome dispatch(const Instruction &instruction, UndoLog &undo);
  ExecutionOutcome run_buffer_program(const Instruction &instruction, UndoLog &undo);
  ExecutionOutcome run_system_program(const Instruction &instruction, UndoLog &undo);
  ExecutionOutcome run_compute_budget(const Instruction &instruction) const;

  Result<bool> verify_changes(const std::vector<AccountState> &before,
                              const std::vector<AccountState> &after) const;

  void remember(UndoLog &undo, const PublicKey &key) const;
  void commit(const AccountState &account, UndoLog &undo);
  void rollback(UndoLog &undo);

  ProgramConfig config_;
  PublicKey program_id_;
  AccountStore accounts_;
  uint64_t transactions_processed_ = 0;
  uint64_t transactions_failed_ = 0;
};

} // namespace runtime
} // namespace chadbuffer
