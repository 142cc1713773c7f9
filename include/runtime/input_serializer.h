#pragma once

#include "common/types.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace chadbuffer {
namespace runtime {

using namespace chadbuffer::common;

/**
 * Account as the host stores it between invocations
 */
struct AccountState {
  PublicKey key;
  PublicKey owner;
  Lamports lamports = 0;
  std::vector<uint8_t> data;
  bool is_signer = false;
  bool is_writable = false;
  bool executable = false;
  Epoch rent_epoch = 0;

  AccountState() : key(PUBKEY_BYTES, 0), owner(PUBKEY_BYTES, 0) {}
};

/**
 * 8-byte aligned byte buffer holding one serialized input region.
 * The program computes the instruction offset from absolute addresses, so
 * the storage must start on an 8-byte boundary.
 */
class AlignedRegion {
public:
  explicit AlignedRegion(size_t size);

  uint8_t *data() { return reinterpret_cast<uint8_t *>(words_.data()); }
  const uint8_t *data() const {
    return reinterpret_cast<const uint8_t *>(words_.data());
  }
  size_t size() const { return size_; }

private:
  std::vector<uint64_t> words_;
  size_t size_;
};

/**
 * Host-side serializer for the aligned parameter format the program reads:
 *
 *   u64 account count
 *   per account: u8 dup marker (0xff, or index of the first occurrence)
 *     non-duplicate: u8 is_signer, u8 is_writable, u8 executable, 4 pad,
 *     key, owner, u64 lamports, u64 data length, data,
 *     10240 zero bytes, pad to 8, u64 rent epoch
 *     duplicate: 7 pad
 *   u64 instruction length, instruction data, program id
 */
class InputSerializer {
public:
  static size_t serialized_size(const std::vector<AccountState> &accounts,
                                size_t instruction_length);

  static std::unique_ptr<AlignedRegion>
  serialize(const std::vector<AccountState> &accounts,
            const std::vector<uint8_t> &instruction_data,
            const PublicKey &program_id);

  /**
   * Copy lamports, owner and data of every non-duplicate account back out
   * of the region. Whether a change was allowed is the caller's decision.
   * Fails if a data length grew beyond the realloc allowance, in which case
   * `accounts` is left as it was.
   */
  static Result<bool> deserialize(const AlignedRegion &region,
                                  std::vector<AccountState> &accounts);
};

} // namespace runtime
} // namespace chadbuffer
