#include "runtime/input_serializer.h"
#include "common/logging.h"
#include "program/layout.h"
#include <algorithm>
#include <cstring>
#include <string>

namespace chadbuffer {
namespace runtime {

using program::ALIGNMENT;
using program::MAX_PERMITTED_DATA_INCREASE;
using program::NON_DUP_MARKER;
using program::PUBKEY_LENGTH;
using program::RENT_EPOCH_LENGTH;

namespace {

constexpr size_t ACCOUNT_HEADER_LENGTH = 8; // marker, 3 flags, 4 pad

size_t align_up(size_t offset) {
  return (offset + ALIGNMENT - 1) / ALIGNMENT * ALIGNMENT;
}

// Index of the first account with the same key, or the account's own index
size_t first_occurrence(const std::vector<AccountState> &accounts, size_t index) {
  for (size_t i = 0; i < index; ++i) {
    if (accounts[i].key == accounts[index].key) {
      return i;
    }
  }
  return index;
}

size_t account_record_length(const AccountState &account) {
  size_t length = ACCOUNT_HEADER_LENGTH + PUBKEY_LENGTH + PUBKEY_LENGTH +
                  sizeof(uint64_t) + sizeof(uint64_t) + account.data.size() +
                  MAX_PERMITTED_DATA_INCREASE;
  return align_up(length) + RENT_EPOCH_LENGTH;
}

class RegionWriter {
public:
  explicit RegionWriter(uint8_t *base) : base_(base) {}

  void put_u8(uint8_t value) { base_[offset_++] = value; }

  void put_u64(uint64_t value) {
    std::memcpy(base_ + offset_, &value, sizeof(value));
    offset_ += sizeof(value);
  }

  void put_bytes(const uint8_t *data, size_t length) {
    if (length > 0) {
      std::memcpy(base_ + offset_, data, length);
    }
    offset_ += length;
  }

  void put_key(const PublicKey &key) {
    uint8_t padded[PUBKEY_LENGTH] = {0};
    std::memcpy(padded, key.data(), std::min(key.size(), PUBKEY_LENGTH));
    put_bytes(padded, PUBKEY_LENGTH);
  }

  // Region storage is zero-initialized, so skipping is zero padding
  void skip(size_t length) { offset_ += length; }
  void align() { offset_ = align_up(offset_); }

  size_t offset() const { return offset_; }

private:
  uint8_t *base_;
  size_t offset_ = 0;
};

} // namespace

AlignedRegion::AlignedRegion(size_t size)
    : words_((size + sizeof(uint64_t) - 1) / sizeof(uint64_t), 0), size_(size) {}

size_t InputSerializer::serialized_size(const std::vector<AccountState> &accounts,
                                        size_t instruction_length) {
  size_t size = sizeof(uint64_t);
  for (size_t i = 0; i < accounts.size(); ++i) {
    if (first_occurrence(accounts, i) != i) {
      size += ACCOUNT_HEADER_LENGTH;
    } else {
      size += account_record_length(accounts[i]);
    }
  }
  return size + sizeof(uint64_t) + instruction_length + PUBKEY_LENGTH;
}

std::unique_ptr<AlignedRegion>
InputSerializer::serialize(const std::vector<AccountState> &accounts,
                           const std::vector<uint8_t> &instruction_data,
                           const PublicKey &program_id) {
  auto region = std::make_unique<AlignedRegion>(
      serialized_size(accounts, instruction_data.size()));
  RegionWriter writer(region->data());

  writer.put_u64(accounts.size());

  for (size_t i = 0; i < accounts.size(); ++i) {
    size_t original = first_occurrence(accounts, i);
    if (original != i) {
      writer.put_u8(static_cast<uint8_t>(original));
      writer.skip(ACCOUNT_HEADER_LENGTH - 1);
      continue;
    }

    const auto &account = accounts[i];
    writer.put_u8(NON_DUP_MARKER);
    writer.put_u8(account.is_signer ? 1 : 0);
    writer.put_u8(account.is_writable ? 1 : 0);
    writer.put_u8(account.executable ? 1 : 0);
    writer.skip(4);
    writer.put_key(account.key);
    writer.put_key(account.owner);
    writer.put_u64(account.lamports);
    writer.put_u64(account.data.size());
    writer.put_bytes(account.data.data(), account.data.size());
    writer.skip(MAX_PERMITTED_DATA_INCREASE);
    writer.align();
    writer.put_u64(account.rent_epoch);
  }

  writer.put_u64(instruction_data.size());
  writer.put_bytes(instruction_data.data(), instruction_data.size());
  writer.put_key(program_id);

  LOG_TRACE("host", "serialized ", accounts.size(), " accounts into ",
            writer.offset(), " bytes");
  return region;
}

Result<bool> InputSerializer::deserialize(const AlignedRegion &region,
                                          std::vector<AccountState> &accounts) {
  struct RecordView {
    size_t index;
    size_t owner_offset;
    size_t lamports_offset;
    size_t data_offset;
    uint64_t new_length;
  };

  const uint8_t *base = region.data();
  size_t offset = sizeof(uint64_t);
  std::vector<RecordView> records;
  records.reserve(accounts.size());

  // Validate every record before touching `accounts`, so a rejected region
  // leaves the caller's vector unchanged
  for (size_t i = 0; i < accounts.size(); ++i) {
    if (first_occurrence(accounts, i) != i) {
      offset += ACCOUNT_HEADER_LENGTH;
      continue;
    }

    const auto &account = accounts[i];
    RecordView record;
    record.index = i;
    record.owner_offset = offset + ACCOUNT_HEADER_LENGTH + PUBKEY_LENGTH;
    record.lamports_offset = record.owner_offset + PUBKEY_LENGTH;
    size_t length_offset = record.lamports_offset + sizeof(uint64_t);
    record.data_offset = length_offset + sizeof(uint64_t);
    offset += account_record_length(account);

    std::memcpy(&record.new_length, base + length_offset, sizeof(record.new_length));
    if (record.new_length > account.data.size() + MAX_PERMITTED_DATA_INCREASE) {
      return Result<bool>("Account data length " + std::to_string(record.new_length) +
                          " exceeds realloc limit for account " +
                          std::to_string(i));
    }
    records.push_back(record);
  }

  for (const auto &record : records) {
    auto &account = accounts[record.index];
    std::memcpy(&account.lamports, base + record.lamports_offset, sizeof(uint64_t));
    account.owner.assign(base + record.owner_offset,
                         base + record.owner_offset + PUBKEY_LENGTH);
    account.data.assign(base + record.data_offset,
                        base + record.data_offset + static_cast<size_t>(record.new_length));
  }

  return Result<bool>(true);
}

} // namespace runtime
} // namespace chadbuffer
