#pragma once

#include "common/types.h"
#include "program/layout.h"
#include <cstdint>
#include <cstring>

namespace chadbuffer {
namespace program {

using common::Result;

/**
 * Bounds-checked view over a host-owned input region.
 *
 * The view borrows the memory for the duration of one invocation and never
 * outlives it. Reads and writes use memcpy so unaligned fields are fine;
 * integers are little-endian like the host that produced them.
 */
class InputRegion {
public:
  /// Validates base pointer, alignment and minimum length
  static Result<InputRegion> borrow(uint8_t *base, size_t size);

  InputRegion() = default;

  bool contains(size_t offset, size_t length) const noexcept {
    return offset <= size_ && length <= size_ - offset;
  }

  const uint8_t *base() const noexcept { return base_; }
  size_t size() const noexcept { return size_; }

  uint8_t read_u8(size_t offset) const { return base_[offset]; }

  uint32_t read_u32(size_t offset) const {
    uint32_t value;
    std::memcpy(&value, base_ + offset, sizeof(value));
    return value;
  }

  uint64_t read_u64(size_t offset) const {
    uint64_t value;
    std::memcpy(&value, base_ + offset, sizeof(value));
    return value;
  }

  /// Little-endian 24-bit read
  uint64_t read_u24(size_t offset) const {
    return static_cast<uint64_t>(base_[offset]) |
           (static_cast<uint64_t>(base_[offset + 1]) << 8) |
           (static_cast<uint64_t>(base_[offset + 2]) << 16);
  }

  void write_u64(size_t offset, uint64_t value) {
    std::memcpy(base_ + offset, &value, sizeof(value));
  }

  const uint8_t *at(size_t offset) const { return base_ + offset; }
  uint8_t *at_mut(size_t offset) { return base_ + offset; }

private:
  InputRegion(uint8_t *base, size_t size) : base_(base), size_(size) {}

  uint8_t *base_ = nullptr;
  size_t size_ = 0;
};

/**
 * Pointer-only view for the raw host entrypoint.
 *
 * Offsets are trusted: the host guarantees the region is well formed and
 * large enough, so contains() always succeeds. Only the entrypoint that
 * receives a bare pointer should construct one.
 */
class TrustedInput {
public:
  explicit TrustedInput(uint8_t *base) : base_(base) {}

  bool contains(size_t, size_t) const noexcept { return true; }

  const uint8_t *base() const noexcept { return base_; }

  uint8_t read_u8(size_t offset) const { return base_[offset]; }

  uint32_t read_u32(size_t offset) const {
    uint32_t value;
    std::memcpy(&value, base_ + offset, sizeof(value));
    return value;
  }

  uint64_t read_u64(size_t offset) const {
    uint64_t value;
    std::memcpy(&value, base_ + offset, sizeof(value));
    return value;
  }

  uint64_t read_u24(size_t offset) const {
    return static_cast<uint64_t>(base_[offset]) |
           (static_cast<uint64_t>(base_[offset + 1]) << 8) |
           (static_cast<uint64_t>(base_[offset + 2]) << 16);
  }

  void write_u64(size_t offset, uint64_t value) {
    std::memcpy(base_ + offset, &value, sizeof(value));
  }

  const uint8_t *at(size_t offset) const { return base_ + offset; }
  uint8_t *at_mut(size_t offset) { return base_ + offset; }

private:
  uint8_t *base_;
};

/**
 * Store zeroes through a volatile pointer so the write survives dead-store
 * elimination; the host reads it after the call returns.
 */
void write_zeroes_volatile(uint8_t *destination, size_t length);

} // namespace program
} // namespace chadbuffer
