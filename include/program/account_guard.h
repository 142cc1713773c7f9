#pragma once

#include "program/decoder.h"
#include "program/status.h"
#include <optional>

namespace chadbuffer {
namespace program {

/**
 * Structural and authority checks that run before any mutation.
 *
 * Only the signer's flags are inspected: with exactly two accounts and a
 * fresh writable signer, a read-only buffer account fails later when the
 * host rejects the mutation, so it is not checked here.
 */
class AccountGuard {
public:
  /// Account count first, then the signer pattern
  static std::optional<ProgramError> check_accounts(const AccountsHeader &header);

  /**
   * Every discriminator except Init must be presented by the stored
   * authority. Unknown discriminators are gated too.
   */
  template <typename Region>
  static std::optional<ProgramError> check_authority(const Region &region,
                                                     uint8_t discriminator);

  static bool keys_equal(const uint8_t *a, const uint8_t *b);
};

} // namespace program
} // namespace chadbuffer
