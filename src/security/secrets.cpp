#include "hostgate/security/secrets.hpp"

#include "hostgate/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace hostgate::security {

namespace {

constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx make_ctx() { return CipherCtx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free); }

const unsigned char *bytes_of(const std::string &value) {
  return reinterpret_cast<const unsigned char *>(value.data());
}

common::Result<std::string> crypto_failure(const std::string &message) {
  return common::Result<std::string>::failure(message, common::ErrorCode::Faulted);
}

} // namespace

common::Result<SecretKey> generate_key() {
  SecretKey key{};
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    return common::Result<SecretKey>::failure("RAND_bytes failed");
  }
  return common::Result<SecretKey>::success(key);
}

common::Result<SecretKey> load_or_create_key(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    const auto raw = common::read_file_bytes(path);
    if (!raw.ok()) {
      return common::Result<SecretKey>::failure("Failed to read key file: " + raw.error(),
                                                common::ErrorCode::Persistence);
    }
    if (raw.value().size() != SecretKey{}.size()) {
      return common::Result<SecretKey>::failure("Key file has invalid size: " + path.string(),
                                                common::ErrorCode::Persistence);
    }
    SecretKey key{};
    std::copy(raw.value().begin(), raw.value().end(), key.begin());
    return common::Result<SecretKey>::success(key);
  }

  auto key = generate_key();
  if (!key.ok()) {
    return key;
  }
  const std::string bytes(key.value().begin(), key.value().end());
  if (auto written = common::atomic_write_file(path, bytes, 0600); !written.ok()) {
    return common::Result<SecretKey>::failure("Failed to write key file: " + written.error(),
                                              common::ErrorCode::Persistence);
  }
  return key;
}

common::Result<std::string> encrypt_secret(const SecretKey &key, const std::string &plaintext) {
  std::array<unsigned char, NONCE_SIZE> nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    return crypto_failure("RAND_bytes failed");
  }

  auto ctx = make_ctx();
  if (ctx == nullptr) {
    return crypto_failure("Failed to create cipher context");
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    return crypto_failure("Encrypt init failed");
  }

  std::vector<unsigned char> ciphertext(plaintext.size() + TAG_SIZE);
  int out_len = 0;
  if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &out_len, bytes_of(plaintext),
                        static_cast<int>(plaintext.size())) != 1) {
    return crypto_failure("Encrypt update failed");
  }
  int total_len = out_len;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total_len, &out_len) != 1) {
    return crypto_failure("Encrypt final failed");
  }
  total_len += out_len;

  std::array<unsigned char, TAG_SIZE> tag{};
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, TAG_SIZE, tag.data()) != 1) {
    return crypto_failure("Failed to get tag");
  }

  std::string blob;
  blob.reserve(NONCE_SIZE + static_cast<std::size_t>(total_len) + TAG_SIZE);
  blob.append(nonce.begin(), nonce.end());
  blob.append(ciphertext.begin(), ciphertext.begin() + total_len);
  blob.append(tag.begin(), tag.end());
  return common::Result<std::string>::success(std::move(blob));
}

common::Result<std::string> decrypt_secret(const SecretKey &key, const std::string &blob) {
  if (blob.size() < NONCE_SIZE + TAG_SIZE) {
    return crypto_failure("Ciphertext too short");
  }

  const auto *nonce = bytes_of(blob);
  const auto *payload = nonce + NONCE_SIZE;
  const std::size_t data_size = blob.size() - NONCE_SIZE - TAG_SIZE;
  std::array<unsigned char, TAG_SIZE> tag{};
  std::copy_n(payload + data_size, TAG_SIZE, tag.begin());

  auto ctx = make_ctx();
  if (ctx == nullptr) {
    return crypto_failure("Failed to create cipher context");
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    return crypto_failure("Decrypt init failed");
  }

  std::vector<unsigned char> plaintext(data_size + TAG_SIZE);
  int out_len = 0;
  if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, payload,
                        static_cast<int>(data_size)) != 1) {
    return crypto_failure("Decrypt update failed");
  }
  int total_len = out_len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, TAG_SIZE, tag.data()) != 1) {
    return crypto_failure("Failed to set tag");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) != 1) {
    return crypto_failure("Decryption failed: wrong key or tampered blob");
  }
  total_len += out_len;

  return common::Result<std::string>::success(
      std::string(plaintext.begin(), plaintext.begin() + total_len));
}

std::string base64_encode(const std::string &bytes) {
  if (bytes.empty()) {
    return "";
  }
  std::string output(4 * ((bytes.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                                      bytes_of(bytes), static_cast<int>(bytes.size()));
  output.resize(static_cast<std::size_t>(std::max(written, 0)));
  return output;
}

common::Result<std::string> base64_decode(const std::string &text) {
  if (text.empty()) {
    return common::Result<std::string>::success("");
  }
  if (text.size() % 4 != 0) {
    return common::Result<std::string>::failure("Invalid base64 input",
                                                common::ErrorCode::Validation);
  }

  std::string decoded(text.size(), '\0');
  const int len = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(decoded.data()),
                                  bytes_of(text), static_cast<int>(text.size()));
  if (len < 0) {
    return common::Result<std::string>::failure("Invalid base64 input",
                                                common::ErrorCode::Validation);
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
  }
  if (text.size() > 1 && text[text.size() - 2] == '=') {
    ++padding;
  }
  decoded.resize(static_cast<std::size_t>(len) - padding);
  return common::Result<std::string>::success(std::move(decoded));
}

KeyFileProtector::KeyFileProtector(std::filesystem::path key_path)
    : key_path_(std::move(key_path)) {}

common::Result<SecretKey> KeyFileProtector::key() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (key_.has_value()) {
    return common::Result<SecretKey>::success(*key_);
  }
  auto loaded = load_or_create_key(key_path_);
  if (loaded.ok()) {
    key_ = loaded.value();
  }
  return loaded;
}

common::Result<std::string> KeyFileProtector::protect(const std::string &plaintext) {
  const auto k = key();
  if (!k.ok()) {
    return common::Result<std::string>::failure(k.status());
  }
  return encrypt_secret(k.value(), plaintext);
}

common::Result<std::string> KeyFileProtector::unprotect(const std::string &blob) {
  const auto k = key();
  if (!k.ok()) {
    return common::Result<std::string>::failure(k.status());
  }
  return decrypt_secret(k.value(), blob);
}

} // namespace hostgate::security
