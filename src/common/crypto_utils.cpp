#include "common/crypto_utils.h"
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace chadbuffer {
namespace common {

namespace {

// Owns an EVP_MD_CTX for the duration of one digest
class DigestContext {
public:
  DigestContext() : ctx_(EVP_MD_CTX_new()) {}
  ~DigestContext() {
    if (ctx_) {
      EVP_MD_CTX_free(ctx_);
    }
  }
  DigestContext(const DigestContext &) = delete;
  DigestContext &operator=(const DigestContext &) = delete;

  EVP_MD_CTX *get() const { return ctx_; }

private:
  EVP_MD_CTX *ctx_;
};

} // namespace

Result<Hash> CryptoUtils::sha256(const uint8_t *data, size_t length) {
  DigestContext ctx;
  if (!ctx.get()) {
    return Result<Hash>("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return Result<Hash>("EVP_DigestInit_ex failed");
  }

  if (length > 0 && EVP_DigestUpdate(ctx.get(), data, length) != 1) {
    return Result<Hash>("EVP_DigestUpdate failed");
  }

  Hash hash(SHA256_DIGEST_LENGTH);
  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &len) != 1) {
    return Result<Hash>("EVP_DigestFinal_ex failed");
  }

  return Result<Hash>(std::move(hash));
}

Result<Hash> CryptoUtils::sha256(const std::vector<uint8_t> &data) {
  return sha256(data.data(), data.size());
}

} // namespace common
} // namespace chadbuffer
