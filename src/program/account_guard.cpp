#include "program/account_guard.h"
#include "common/logging.h"
#include "program/instruction.h"
#include <cstring>

namespace chadbuffer {
namespace program {

std::optional<ProgramError>
AccountGuard::check_accounts(const AccountsHeader &header) {
  if (header.account_count != EXPECTED_ACCOUNTS) {
    LOG_DEBUG("program", "account count ", header.account_count);
    return ProgramError::WrongAccountCount;
  }

  if (!header.signer_flags.is_fresh_writable_signer()) {
    LOG_DEBUG("program", "signer flags 0x", std::hex,
              header.signer_flags.encode(), std::dec, " (",
              header.signer_flags.describe(), ")");
    return ProgramError::MissingSigner;
  }

  return std::nullopt;
}

template <typename Region>
std::optional<ProgramError>
AccountGuard::check_authority(const Region &region, uint8_t discriminator) {
  if (discriminator == static_cast<uint8_t>(BufferInstruction::Init)) {
    return std::nullopt;
  }

  if (!keys_equal(LayoutDecoder<Region>::buffer_authority(region),
                  LayoutDecoder<Region>::signer_key(region))) {
    return ProgramError::InvalidAuthority;
  }

  return std::nullopt;
}

bool AccountGuard::keys_equal(const uint8_t *a, const uint8_t *b) {
  return std::memcmp(a, b, PUBKEY_LENGTH) == 0;
}

template std::optional<ProgramError>
AccountGuard::check_authority<InputRegion>(const InputRegion &, uint8_t);
template std::optional<ProgramError>
AccountGuard::check_authority<TrustedInput>(const TrustedInput &, uint8_t);

} // namespace program
} // namespace chadbuffer
