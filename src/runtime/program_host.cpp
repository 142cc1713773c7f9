#include "runtime/program_host.h"
#include "common/base58.h"
#include "common/logging.h"
#include "program/layout.h"
#include "program/processor.h"
#include <algorithm>
#include <cstring>

namespace chadbuffer {
namespace runtime {

const PublicKey BufferProgramHost::SYSTEM_PROGRAM_ID = PublicKey(PUBKEY_BYTES, 0x00);
const PublicKey BufferProgramHost::COMPUTE_BUDGET_PROGRAM_ID =
    pubkey_from_base58("ComputeBudget111111111111111111111111111111")
        .value_or(PublicKey(PUBKEY_BYTES, 0xcb));

namespace {

enum class SystemInstruction : uint32_t { CreateAccount = 0, Transfer = 2 };
enum class ComputeBudgetInstruction : uint8_t {
  SetComputeUnitLimit = 2,
  SetComputeUnitPrice = 3
};

template <typename T>
T read_le(const std::vector<uint8_t> &data, size_t offset) {
  T value;
  std::memcpy(&value, data.data() + offset, sizeof(T));
  return value;
}

ExecutionOutcome failure(ExecutionResult result, const std::string &details) {
  ExecutionOutcome outcome;
  outcome.result = result;
  outcome.status_code = program::STATUS_FAILURE;
  outcome.error_details = details;
  return outcome;
}

ExecutionOutcome host_violation(const std::string &details) {
  LOG_HOST_ERROR("host violation", "host_violation", {{"details", details}});
  return failure(ExecutionResult::HOST_VIOLATION, details);
}

bool is_duplicate(const std::vector<AccountState> &accounts, size_t index) {
  for (size_t j = 0; j < index; ++j) {
    if (accounts[j].key == accounts[index].key) {
      return true;
    }
  }
  return false;
}

bool all_zero(const std::vector<uint8_t> &data) {
  return std::all_of(data.begin(), data.end(),
                     [](uint8_t byte) { return byte == 0; });
}

} // namespace

const char *execution_result_name(ExecutionResult result) {
  switch (result) {
  case ExecutionResult::SUCCESS:
    return "SUCCESS";
  case ExecutionResult::PROGRAM_ERROR:
    return "PROGRAM_ERROR";
  case ExecutionResult::ACCOUNT_NOT_FOUND:
    return "ACCOUNT_NOT_FOUND";
  case ExecutionResult::INSUFFICIENT_FUNDS:
    return "INSUFFICIENT_FUNDS";
  case ExecutionResult::INVALID_INSTRUCTION:
    return "INVALID_INSTRUCTION";
  case ExecutionResult::HOST_VIOLATION:
    return "HOST_VIOLATION";
  }
  return "UNKNOWN";
}

BufferProgramHost::BufferProgramHost(const ProgramConfig &config, PublicKey program_id)
    : config_(config), program_id_(std::move(program_id)) {
  if (program_id_.empty()) {
    program_id_ = pubkey_from_base58(program::PROGRAM_ADDRESS)
                      .value_or(PublicKey(PUBKEY_BYTES, 0xbf));
  }
}

void BufferProgramHost::set_account(const AccountState &account) {
  AccountState stored = account;
  stored.is_signer = false;
  stored.is_writable = false;
  accounts_[stored.key] = std::move(stored);
}

std::optional<AccountState> BufferProgramHost::get_account(const PublicKey &key) const {
  auto it = accounts_.find(key);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool BufferProgramHost::account_exists(const PublicKey &key) const {
  return accounts_.find(key) != accounts_.end();
}

Lamports BufferProgramHost::balance(const PublicKey &key) const {
  auto it = accounts_.find(key);
  return it == accounts_.end() ? 0 : it->second.lamports;
}

Lamports BufferProgramHost::rent_exempt_minimum(size_t data_size) {
  return static_cast<Lamports>(ACCOUNT_STORAGE_OVERHEAD + data_size) *
         LAMPORTS_PER_BYTE_YEAR * EXEMPTION_THRESHOLD_YEARS;
}

ExecutionOutcome BufferProgramHost::execute(const Instruction &instruction) {
  return execute_transaction({instruction});
}

ExecutionOutcome
BufferProgramHost::execute_transaction(const std::vector<Instruction> &instructions) {
  UndoLog undo;
  ExecutionOutcome final_outcome;

  for (const auto &instruction : instructions) {
    auto outcome = dispatch(instruction, undo);
    final_outcome.logs.insert(final_outcome.logs.end(), outcome.logs.begin(),
                              outcome.logs.end());

    if (!outcome.is_success()) {
      final_outcome.result = outcome.result;
      final_outcome.status_code = outcome.status_code;
      final_outcome.error_details = outcome.error_details;
      rollback(undo);
      transactions_failed_++;
      LOG_STRUCTURED(LogLevel::WARN, "host", "transaction rolled back",
                     execution_result_name(outcome.result),
                     {{"details", outcome.error_details}});
      return final_outcome;
    }
  }

  transactions_processed_++;
  return final_outcome;
}

ExecutionOutcome BufferProgramHost::dispatch(const Instruction &instruction,
                                             UndoLog &undo) {
  if (instruction.program_id == program_id_) {
    return run_buffer_program(instruction, undo);
  }
  if (instruction.program_id == SYSTEM_PROGRAM_ID) {
    return run_system_program(instruction, undo);
  }
  if (instruction.program_id == COMPUTE_BUDGET_PROGRAM_ID) {
    return run_compute_budget(instruction);
  }
  return failure(ExecutionResult::PROGRAM_ERROR,
                 "Program not found: " + encode_base58(instruction.program_id));
}

ExecutionOutcome BufferProgramHost::run_buffer_program(const Instruction &instruction,
                                                       UndoLog &undo) {
  std::vector<AccountState> before;
  before.reserve(instruction.accounts.size());
  for (const auto &meta : instruction.accounts) {
    auto it = accounts_.find(meta.pubkey);
    if (it == accounts_.end()) {
      return failure(ExecutionResult::ACCOUNT_NOT_FOUND,
                     "Account not found: " + encode_base58(meta.pubkey));
    }
    AccountState account = it->second;
    account.is_signer = meta.is_signer;
    account.is_writable = meta.is_writable;
    before.push_back(std::move(account));
  }

  auto region = InputSerializer::serialize(before, instruction.data, program_id_);

  // Duplicate account metas shrink the region below the fixed layout
  auto checked = program::InputRegion::borrow(region->data(), region->size());
  if (checked.is_err()) {
    return host_violation(checked.error());
  }

  program::InvocationResult invocation;
  if (config_.trusted_input) {
    // TrustedInput reads and writes without bounds checks; only hand it a
    // region whose validated ranges all lie inside the allocation
    auto dry_run = program::BufferProcessor<program::InputRegion>(checked.value()).validate();
    if (program::is_error(dry_run) &&
        std::get<program::ProgramError>(dry_run) == program::ProgramError::RegionOutOfBounds) {
      return host_violation("Region would be overrun on the trusted input path");
    }
    invocation = program::process_instruction(program::TrustedInput(region->data()));
  } else {
    invocation = program::process_instruction(checked.value());
  }

  ExecutionOutcome outcome;
  outcome.status_code = invocation.status;
  outcome.logs = std::move(invocation.logs);
  if (!invocation.is_success()) {
    outcome.result = ExecutionResult::PROGRAM_ERROR;
    outcome.error_details = invocation.error
                                ? program::error_message(*invocation.error)
                                : "custom program error";
    return outcome;
  }

  std::vector<AccountState> after = before;
  auto read_back = InputSerializer::deserialize(*region, after);
  if (read_back.is_err()) {
    auto violation = host_violation(read_back.error());
    violation.logs = std::move(outcome.logs);
    return violation;
  }

  auto verified = verify_changes(before, after);
  if (verified.is_err()) {
    auto violation = host_violation(verified.error());
    violation.logs = std::move(outcome.logs);
    return violation;
  }

  for (size_t i = 0; i < after.size(); ++i) {
    if (after[i].is_writable && !is_duplicate(after, i)) {
      commit(after[i], undo);
    }
  }
  return outcome;
}

Result<bool> BufferProgramHost::verify_changes(const std::vector<AccountState> &before,
                                               const std::vector<AccountState> &after) const {
  Lamports lamports_before = 0;
  Lamports lamports_after = 0;

  for (size_t i = 0; i < before.size(); ++i) {
    const auto &pre = before[i];
    const auto &post = after[i];
    std::string who = encode_base58(pre.key);

    // Duplicates are verified through their first occurrence
    if (is_duplicate(before, i)) {
      continue;
    }

    lamports_before += pre.lamports;
    lamports_after += post.lamports;

    bool data_changed = pre.data != post.data;
    bool owner_changed = pre.owner != post.owner;
    bool lamports_changed = pre.lamports != post.lamports;

    if (!pre.is_writable && (data_changed || owner_changed || lamports_changed)) {
      return Result<bool>("Read-only account modified: " + who);
    }
    if (pre.executable && (data_changed || owner_changed || lamports_changed)) {
      return Result<bool>("Executable account modified: " + who);
    }

    bool owned = pre.owner == program_id_;
    if (!owned && (data_changed || owner_changed)) {
      return Result<bool>("Account not owned by program modified: " + who);
    }
    if (!owned && post.lamports < pre.lamports) {
      return Result<bool>("Lamports spent from account not owned by program: " + who);
    }
    if (owner_changed && !all_zero(post.data)) {
      return Result<bool>("Owner changed on account with live data: " + who);
    }
  }

  if (lamports_before != lamports_after) {
    return Result<bool>("Sum of account balances changed");
  }
  return Result<bool>(true);
}

ExecutionOutcome BufferProgramHost::run_system_program(const Instruction &instruction,
                                                       UndoLog &undo) {
  const auto &data = instruction.data;
  if (data.size() < sizeof(uint32_t) || instruction.accounts.size() < 2) {
    return failure(ExecutionResult::INVALID_INSTRUCTION, "Malformed system instruction");
  }

  const auto &from_meta = instruction.accounts[0];
  const auto &to_meta = instruction.accounts[1];
  if (!from_meta.is_signer || !from_meta.is_writable || !to_meta.is_writable) {
    return failure(ExecutionResult::INVALID_INSTRUCTION,
                   "System instruction requires a writable funding signer");
  }

  auto from_it = accounts_.find(from_meta.pubkey);
  if (from_it == accounts_.end()) {
    return failure(ExecutionResult::ACCOUNT_NOT_FOUND,
                   "Funding account not found: " + encode_base58(from_meta.pubkey));
  }

  auto tag = static_cast<SystemInstruction>(read_le<uint32_t>(data, 0));
  ExecutionOutcome outcome;

  if (tag == SystemInstruction::CreateAccount) {
    // u32 tag, u64 lamports, u64 space, owner
    if (data.size() < 4 + 8 + 8 + PUBKEY_BYTES) {
      return failure(ExecutionResult::INVALID_INSTRUCTION, "Malformed create-account");
    }
    if (!to_meta.is_signer) {
      return failure(ExecutionResult::INVALID_INSTRUCTION,
                     "New account must sign create-account");
    }
    auto lamports = read_le<uint64_t>(data, 4);
    auto space = read_le<uint64_t>(data, 12);
    PublicKey owner(data.begin() + 20, data.begin() + 20 + PUBKEY_BYTES);

    auto existing = accounts_.find(to_meta.pubkey);
    if (existing != accounts_.end() &&
        (existing->second.lamports > 0 || !existing->second.data.empty())) {
      return failure(ExecutionResult::INVALID_INSTRUCTION,
                     "Account already in use: " + encode_base58(to_meta.pubkey));
    }
    if (from_it->second.lamports < lamports) {
      return failure(ExecutionResult::INSUFFICIENT_FUNDS,
                     "Insufficient funds for create-account");
    }

    AccountState funder = from_it->second;
    funder.lamports -= lamports;

    AccountState created;
    created.key = to_meta.pubkey;
    created.owner = owner;
    created.lamports = lamports;
    created.data.assign(static_cast<size_t>(space), 0);

    commit(funder, undo);
    commit(created, undo);
    LOG_DEBUG("host", "created account ", encode_base58(created.key), " space=",
              space, " lamports=", lamports);
    return outcome;
  }

  if (tag == SystemInstruction::Transfer) {
    if (data.size() < 4 + 8) {
      return failure(ExecutionResult::INVALID_INSTRUCTION, "Malformed transfer");
    }
    auto lamports = read_le<uint64_t>(data, 4);
    if (from_it->second.lamports < lamports) {
      return failure(ExecutionResult::INSUFFICIENT_FUNDS, "Insufficient funds for transfer");
    }
    // Both deltas land on one account
    if (to_meta.pubkey == from_meta.pubkey) {
      return outcome;
    }
    AccountState from = from_it->second;
    AccountState to;
    auto to_it = accounts_.find(to_meta.pubkey);
    if (to_it != accounts_.end()) {
      to = to_it->second;
    } else {
      to.key = to_meta.pubkey;
      to.owner = SYSTEM_PROGRAM_ID;
    }
    from.lamports -= lamports;
    to.lamports += lamports;
    commit(from, undo);
    commit(to, undo);
    return outcome;
  }

  return failure(ExecutionResult::INVALID_INSTRUCTION, "Unsupported system instruction");
}

ExecutionOutcome BufferProgramHost::run_compute_budget(const Instruction &instruction) const {
  const auto &data = instruction.data;
  if (data.empty()) {
    return failure(ExecutionResult::INVALID_INSTRUCTION, "Empty compute budget instruction");
  }

  switch (static_cast<ComputeBudgetInstruction>(data[0])) {
  case ComputeBudgetInstruction::SetComputeUnitLimit:
    if (data.size() != 1 + sizeof(uint32_t)) {
      break;
    }
    LOG_DEBUG("host", "compute unit limit ", read_le<uint32_t>(data, 1));
    return ExecutionOutcome();
  case ComputeBudgetInstruction::SetComputeUnitPrice:
    if (data.size() != 1 + sizeof(uint64_t)) {
      break;
    }
    LOG_DEBUG("host", "compute unit price ", read_le<uint64_t>(data, 1));
    return ExecutionOutcome();
  }
  return failure(ExecutionResult::INVALID_INSTRUCTION, "Invalid compute budget instruction");
}

void BufferProgramHost::remember(UndoLog &undo, const PublicKey &key) const {
  if (undo.find(key) != undo.end()) {
    return;
  }
  auto it = accounts_.find(key);
  if (it == accounts_.end()) {
    undo.emplace(key, std::nullopt);
  } else {
    undo.emplace(key, it->second);
  }
}

void BufferProgramHost::commit(const AccountState &account, UndoLog &undo) {
  remember(undo, account.key);

  // Zero-lamport accounts are garbage collected
  if (account.lamports == 0) {
    accounts_.erase(account.key);
    LOG_DEBUG("host", "purged account ", encode_base58(account.key));
    return;
  }
  set_account(account);
}

void BufferProgramHost::rollback(UndoLog &undo) {
  for (auto &[key, snapshot] : undo) {
    if (snapshot) {
      accounts_[key] = std::move(*snapshot);
    } else {
      accounts_.erase(key);
    }
  }
  undo.clear();
}

} // namespace runtime
} // namespace chadbuffer
