#include "program/entrypoint.h"
#include "common/logging.h"
#include "program/processor.h"

using namespace chadbuffer::program;

extern "C" uint64_t chadbuffer_entrypoint(uint8_t *input) {
  return process_instruction(TrustedInput(input)).status;
}

extern "C" uint64_t chadbuffer_entrypoint_checked(uint8_t *input, uint64_t size) {
  auto region = InputRegion::borrow(input, static_cast<size_t>(size));
  if (region.is_err()) {
    LOG_PROGRAM_ERROR(region.error(), "region_out_of_bounds");
    return STATUS_FAILURE;
  }
  return process_instruction(region.value()).status;
}
