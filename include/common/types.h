#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chadbuffer {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types shared by the buffer program, its host harness
 * and the client SDK.
 */

/// @brief SHA-256 digest (32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Ed25519 public key representation (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// @brief Native token amount in smallest unit (1 SOL = 1,000,000,000 lamports)
using Lamports = uint64_t;

/// @brief Epoch number stored in an account's rent-epoch trailer
using Epoch = uint64_t;

/// @brief Width of a serialized public key
constexpr size_t PUBKEY_BYTES = 32;

/**
 * @brief Runtime configuration for hosts embedding the buffer program
 *
 * The program core reads no configuration of its own; these knobs only
 * affect how a host or tool prepares and observes an invocation.
 */
struct ProgramConfig {
  std::string log_level = "info"; ///< trace/debug/info/warn/error
  bool json_logs = false;         ///< Emit log lines as JSON objects
  bool trusted_input = false;     ///< Run the unchecked raw-pointer path
};

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value or an error message. Used for every
 * fallible operation outside the program's hot path.
 *
 * @tparam T The type of the success value
 *
 * Example usage:
 * @code
 * auto region = program::InputRegion::borrow(bytes.data(), bytes.size());
 * if (region.is_err()) {
 *     std::cerr << "bad region: " << region.error() << std::endl;
 * }
 * @endcode
 */
template <typename T>
class Result {
private:
  bool success_;
  T value_;
  std::string error_;

public:
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  explicit Result(const char *error) : success_(false), value_(), error_(error) {}

  explicit Result(const std::string &error)
      : success_(false), value_(), error_(error) {}

  Result(const Result &other) = default;
  Result(Result &&other) noexcept = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) noexcept = default;

  bool is_ok() const noexcept { return success_; }
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }
  T &&value() && { return std::move(value_); }

  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

/**
 * @brief Account reference carried by an instruction
 */
struct AccountMeta {
  PublicKey pubkey;
  bool is_signer = false;
  bool is_writable = false;

  AccountMeta() = default;
  AccountMeta(PublicKey key, bool signer, bool writable)
      : pubkey(std::move(key)), is_signer(signer), is_writable(writable) {}
};

/**
 * @brief Instruction addressed to a program
 */
struct Instruction {
  PublicKey program_id;
  std::vector<AccountMeta> accounts;
  std::vector<uint8_t> data;
};

/// @brief Render bytes as lowercase hex, used by logs and tools
std::string to_hex(const uint8_t *data, size_t length);
std::string to_hex(const std::vector<uint8_t> &data);

} // namespace common
} // namespace chadbuffer

/**
 * @brief Standard library hash specialization for byte vectors
 *
 * Lets PublicKey be used as a key in std::unordered_map, which the host
 * harness uses for its account store.
 */
namespace std {
template <>
struct hash<std::vector<uint8_t>> {
  std::size_t operator()(const std::vector<uint8_t> &v) const noexcept {
    std::size_t seed = v.size();
    for (const auto &byte : v) {
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
