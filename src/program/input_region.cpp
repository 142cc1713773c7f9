#include "program/input_region.h"
#include <atomic>
#include <string>

namespace chadbuffer {
namespace program {

Result<InputRegion> InputRegion::borrow(uint8_t *base, size_t size) {
  if (base == nullptr) {
    return Result<InputRegion>("Input region is null");
  }
  if (reinterpret_cast<uintptr_t>(base) % ALIGNMENT != 0) {
    return Result<InputRegion>("Input region is not 8-byte aligned");
  }
  if (size < InputLayout::MIN_REGION_SIZE) {
    return Result<InputRegion>("Input region too small: " + std::to_string(size) +
                               " < " +
                               std::to_string(InputLayout::MIN_REGION_SIZE));
  }
  return Result<InputRegion>(InputRegion(base, size));
}

void write_zeroes_volatile(uint8_t *destination, size_t length) {
  volatile uint8_t *out = destination;
  for (size_t i = 0; i < length; ++i) {
    out[i] = 0;
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
}

} // namespace program
} // namespace chadbuffer
