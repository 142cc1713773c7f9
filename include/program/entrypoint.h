#pragma once

#include <cstdint>

/**
 * Host entrypoints of the buffer program. The return value is the status
 * word the host inspects: 0 on success, 1 on any rejection.
 */
extern "C" {

/// Raw entrypoint; the region is trusted to be well formed and large enough
uint64_t chadbuffer_entrypoint(uint8_t *input);

/// Bounds-checked entrypoint for hosts that know the region size
uint64_t chadbuffer_entrypoint_checked(uint8_t *input, uint64_t size);

}
