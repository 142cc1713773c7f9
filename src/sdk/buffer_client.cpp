#include "sdk/buffer_client.h"
#include "common/base58.h"
#include "common/crypto_utils.h"
#include "common/logging.h"
#include "program/layout.h"
#include <algorithm>

namespace chadbuffer {
namespace sdk {

namespace {

const char *COMPUTE_BUDGET_ADDRESS = "ComputeBudget111111111111111111111111111111";

constexpr uint32_t SYSTEM_CREATE_ACCOUNT = 0;
constexpr uint8_t SET_COMPUTE_UNIT_LIMIT = 2;
constexpr uint8_t SET_COMPUTE_UNIT_PRICE = 3;

void append_le(std::vector<uint8_t> &out, uint64_t value, size_t width) {
  for (size_t i = 0; i < width; ++i) {
    out.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

} // namespace

Result<BufferClient> BufferClient::create(std::vector<uint8_t> data,
                                          const ComputeBudget &budget,
                                          PublicKey buffer_key,
                                          PublicKey program_id) {
  if (buffer_key.size() != PUBKEY_BYTES) {
    return Result<BufferClient>("Buffer key must be 32 bytes");
  }
  if (data.size() > MAX_DATA_SIZE) {
    return Result<BufferClient>("Data exceeds the 24-bit write offset range");
  }

  BufferClient client;
  if (program_id.empty()) {
    auto decoded = pubkey_from_base58(program::PROGRAM_ADDRESS);
    if (decoded.is_err()) {
      return Result<BufferClient>("Invalid program address: " + decoded.error());
    }
    client.program_id_ = decoded.value();
  } else if (program_id.size() != PUBKEY_BYTES) {
    return Result<BufferClient>("Program id must be 32 bytes");
  } else {
    client.program_id_ = std::move(program_id);
  }

  auto checksum = CryptoUtils::sha256(data);
  if (checksum.is_err()) {
    return Result<BufferClient>("Checksum failed: " + checksum.error());
  }

  client.buffer_key_ = std::move(buffer_key);
  client.data_ = std::move(data);
  client.checksum_ = checksum.value();
  client.build_pre_instructions(budget);
  client.create_shards();

  LOG_DEBUG("sdk", "buffer ", encode_base58(client.buffer_key_), " size=",
            client.account_size(), " shards=", client.shards_.size());
  return Result<BufferClient>(std::move(client));
}

void BufferClient::build_pre_instructions(const ComputeBudget &budget) {
  // Zero-valued settings are treated as unset
  bool has_price = budget.micro_lamports.has_value() && *budget.micro_lamports != 0;
  bool has_limit = budget.units.has_value() && *budget.units != 0;
  if (!has_price && !has_limit) {
    return;
  }

  PublicKey compute_budget_id = pubkey_from_base58(COMPUTE_BUDGET_ADDRESS).value();
  dynamic_ix_size_ += COMPUTE_BUDGET_BASE_SIZE;

  if (has_price) {
    Instruction ix;
    ix.program_id = compute_budget_id;
    ix.data.push_back(SET_COMPUTE_UNIT_PRICE);
    append_le(ix.data, *budget.micro_lamports, sizeof(uint64_t));
    pre_instructions_.push_back(std::move(ix));
    dynamic_ix_size_ += COMPUTE_BUDGET_ENTRY_SIZE;
  }
  if (has_limit) {
    Instruction ix;
    ix.program_id = compute_budget_id;
    ix.data.push_back(SET_COMPUTE_UNIT_LIMIT);
    append_le(ix.data, *budget.units, sizeof(uint32_t));
    pre_instructions_.push_back(std::move(ix));
    dynamic_ix_size_ += COMPUTE_BUDGET_ENTRY_SIZE;
  }
}

void BufferClient::create_shards() {
  const size_t init_capacity = TX_SIZE - dynamic_ix_size_ - INIT_DATA_SIZE;
  const size_t write_capacity = TX_SIZE - dynamic_ix_size_ - WRITE_DATA_SIZE;

  size_t offset = std::min(init_capacity, data_.size());
  shards_.emplace_back(data_.begin(), data_.begin() + offset);

  while (offset < data_.size()) {
    size_t length = std::min(write_capacity, data_.size() - offset);
    std::vector<uint8_t> shard;
    shard.reserve(program::U24_LENGTH + length);
    append_le(shard, offset, program::U24_LENGTH);
    shard.insert(shard.end(), data_.begin() + offset, data_.begin() + offset + length);
    shards_.push_back(std::move(shard));
    offset += length;
  }
}

Instruction BufferClient::create_initialize_instruction(const PublicKey &authority) const {
  Instruction ix;
  ix.program_id = program_id_;
  ix.data.push_back(static_cast<uint8_t>(ClientInstruction::Initialize));
  ix.data.insert(ix.data.end(), shards_.front().begin(), shards_.front().end());
  ix.accounts.emplace_back(authority, true, true);
  ix.accounts.emplace_back(buffer_key_, true, true);
  return ix;
}

Instruction BufferClient::create_assign_instruction(const PublicKey &authority,
                                                    const PublicKey &new_authority) const {
  Instruction ix;
  ix.program_id = program_id_;
  ix.data.push_back(static_cast<uint8_t>(ClientInstruction::Assign));
  ix.data.insert(ix.data.end(), new_authority.begin(), new_authority.end());
  ix.accounts.emplace_back(authority, true, true);
  ix.accounts.emplace_back(buffer_key_, false, true);
  return ix;
}

Instruction BufferClient::create_write_instruction(const PublicKey &authority,
                                                   const std::vector<uint8_t> &shard) const {
  Instruction ix;
  ix.program_id = program_id_;
  ix.data.push_back(static_cast<uint8_t>(ClientInstruction::Write));
  ix.data.insert(ix.data.end(), shard.begin(), shard.end());
  ix.accounts.emplace_back(authority, true, true);
  ix.accounts.emplace_back(buffer_key_, false, true);
  return ix;
}

Instruction BufferClient::create_close_instruction(const PublicKey &authority) const {
  Instruction ix;
  ix.program_id = program_id_;
  ix.data.push_back(static_cast<uint8_t>(ClientInstruction::Close));
  ix.accounts.emplace_back(authority, true, true);
  ix.accounts.emplace_back(buffer_key_, false, true);
  return ix;
}

Instruction BufferClient::create_account_instruction(const PublicKey &authority,
                                                     Lamports lamports) const {
  Instruction ix;
  ix.program_id = PublicKey(PUBKEY_BYTES, 0x00);
  append_le(ix.data, SYSTEM_CREATE_ACCOUNT, sizeof(uint32_t));
  append_le(ix.data, lamports, sizeof(uint64_t));
  append_le(ix.data, account_size(), sizeof(uint64_t));
  ix.data.insert(ix.data.end(), program_id_.begin(), program_id_.end());
  ix.accounts.emplace_back(authority, true, true);
  ix.accounts.emplace_back(buffer_key_, true, true);
  return ix;
}

std::vector<Instruction> BufferClient::with_pre_instructions(Instruction instruction) const {
  std::vector<Instruction> transaction = pre_instructions_;
  transaction.push_back(std::move(instruction));
  return transaction;
}

std::vector<Instruction>
BufferClient::create_initialize_transaction(const PublicKey &authority,
                                            Lamports lamports) const {
  auto transaction = with_pre_instructions(create_account_instruction(authority, lamports));
  transaction.push_back(create_initialize_instruction(authority));
  return transaction;
}

std::vector<Instruction>
BufferClient::create_assign_transaction(const PublicKey &authority,
                                        const PublicKey &new_authority) const {
  return with_pre_instructions(create_assign_instruction(authority, new_authority));
}

std::vector<std::vector<Instruction>>
BufferClient::create_write_transactions(const PublicKey &authority) const {
  std::vector<std::vector<Instruction>> transactions;
  for (size_t i = 1; i < shards_.size(); ++i) {
    transactions.push_back(with_pre_instructions(create_write_instruction(authority, shards_[i])));
  }
  return transactions;
}

std::vector<Instruction> BufferClient::create_close_transaction(const PublicKey &authority) const {
  return with_pre_instructions(create_close_instruction(authority));
}

Result<bool> BufferClient::verify(const std::vector<uint8_t> &account_data) const {
  if (account_data.size() < PUBKEY_BYTES) {
    return Result<bool>("Account data shorter than the authority prefix");
  }
  auto hash = CryptoUtils::sha256(account_data.data() + PUBKEY_BYTES,
                                  account_data.size() - PUBKEY_BYTES);
  if (hash.is_err()) {
    return Result<bool>("Checksum failed: " + hash.error());
  }
  return Result<bool>(hash.value() == checksum_);
}

} // namespace sdk
} // namespace chadbuffer
