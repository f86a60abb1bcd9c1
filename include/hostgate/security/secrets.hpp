#pragma once

#include "hostgate/common/result.hpp"

#include <array>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace hostgate::security {

using SecretKey = std::array<unsigned char, 32>;

[[nodiscard]] common::Result<SecretKey> generate_key();
/// Reads a 32-byte key, creating it with mode 0600 when absent.
[[nodiscard]] common::Result<SecretKey> load_or_create_key(const std::filesystem::path &path);

/// ChaCha20-Poly1305. Output is nonce || ciphertext || tag, raw bytes.
[[nodiscard]] common::Result<std::string> encrypt_secret(const SecretKey &key,
                                                         const std::string &plaintext);
[[nodiscard]] common::Result<std::string> decrypt_secret(const SecretKey &key,
                                                         const std::string &blob);

[[nodiscard]] std::string base64_encode(const std::string &bytes);
[[nodiscard]] common::Result<std::string> base64_decode(const std::string &text);

/// Turns a secret into an opaque blob that is useless outside the current user account.
class ISecretProtector {
public:
  virtual ~ISecretProtector() = default;

  [[nodiscard]] virtual common::Result<std::string> protect(const std::string &plaintext) = 0;
  [[nodiscard]] virtual common::Result<std::string> unprotect(const std::string &blob) = 0;
};

/// Default protector: a per-user key file (mode 0600) beside the store.
class KeyFileProtector final : public ISecretProtector {
public:
  explicit KeyFileProtector(std::filesystem::path key_path);

  [[nodiscard]] common::Result<std::string> protect(const std::string &plaintext) override;
  [[nodiscard]] common::Result<std::string> unprotect(const std::string &blob) override;

private:
  common::Result<SecretKey> key();

  std::filesystem::path key_path_;
  std::mutex mutex_;
  std::optional<SecretKey> key_;
};

} // namespace hostgate::security
