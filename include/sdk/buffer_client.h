#pragma once

#include "common/types.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace chadbuffer {
namespace sdk {

using namespace chadbuffer::common;

/**
 * Instruction discriminators as the client encodes them
 */
enum class ClientInstruction : uint8_t {
  Initialize = 0,
  Assign = 1,
  Write = 2,
  Close = 3
};

/**
 * Optional compute budget settings prepended to every transaction
 */
struct ComputeBudget {
  std::optional<uint64_t> micro_lamports; ///< SetComputeUnitPrice
  std::optional<uint32_t> units;          ///< SetComputeUnitLimit
};

/**
 * @brief Client for uploading a blob into a buffer account
 *
 * Splits the blob into shards that each fit in one transaction next to the
 * instruction overhead, and builds the Init/Assign/Write/Close instructions
 * for them. The first shard travels with Init; the rest are Writes whose
 * payload starts with the shard's 3-byte little-endian offset. A SHA-256
 * checksum of the blob lets the caller verify the uploaded account.
 */
class BufferClient {
public:
  static constexpr size_t INIT_DATA_SIZE = 358;
  static constexpr size_t WRITE_DATA_SIZE = 208;
  static constexpr size_t TX_SIZE = 1232;

  /// Per-transaction bytes used by the compute budget instructions
  static constexpr size_t COMPUTE_BUDGET_BASE_SIZE = 36;
  static constexpr size_t COMPUTE_BUDGET_ENTRY_SIZE = 8;

  /// Largest blob a 24-bit Write offset can address
  static constexpr size_t MAX_DATA_SIZE = 0x1000000;

  static Result<BufferClient> create(std::vector<uint8_t> data,
                                     const ComputeBudget &budget,
                                     PublicKey buffer_key,
                                     PublicKey program_id = PublicKey());

  const PublicKey &program_id() const { return program_id_; }
  const PublicKey &buffer_key() const { return buffer_key_; }
  const Hash &checksum() const { return checksum_; }

  /// Account data size: authority + blob
  size_t account_size() const { return data_.size() + PUBKEY_BYTES; }
  size_t dynamic_ix_size() const { return dynamic_ix_size_; }

  const std::vector<std::vector<uint8_t>> &shards() const { return shards_; }
  const std::vector<Instruction> &pre_instructions() const { return pre_instructions_; }

  Instruction create_initialize_instruction(const PublicKey &authority) const;
  Instruction create_assign_instruction(const PublicKey &authority,
                                        const PublicKey &new_authority) const;
  Instruction create_write_instruction(const PublicKey &authority,
                                       const std::vector<uint8_t> &shard) const;
  Instruction create_close_instruction(const PublicKey &authority) const;

  /// System create-account funded by the authority, owned by the program
  Instruction create_account_instruction(const PublicKey &authority,
                                         Lamports lamports) const;

  /// Transactions as instruction lists, each prefixed with pre_instructions()
  std::vector<Instruction> create_initialize_transaction(const PublicKey &authority,
                                                         Lamports lamports) const;
  std::vector<Instruction> create_assign_transaction(const PublicKey &authority,
                                                     const PublicKey &new_authority) const;
  std::vector<std::vector<Instruction>>
  create_write_transactions(const PublicKey &authority) const;
  std::vector<Instruction> create_close_transaction(const PublicKey &authority) const;

  /// True when account_data[32..] hashes to checksum()
  Result<bool> verify(const std::vector<uint8_t> &account_data) const;

  BufferClient() = default;

private:
  void build_pre_instructions(const ComputeBudget &budget);
  void create_shards();
  std::vector<Instruction> with_pre_instructions(Instruction instruction) const;

  PublicKey program_id_;
  PublicKey buffer_key_;
  std::vector<uint8_t> data_;
  Hash checksum_;
  size_t dynamic_ix_size_ = 0;
  std::vector<std::vector<uint8_t>> shards_;
  std::vector<Instruction> pre_instructions_;
};

} // namespace sdk
} // namespace chadbuffer
