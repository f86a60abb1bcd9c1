#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/security/secrets.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace hostgate::security {

struct CredentialStoreOptions {
  std::filesystem::path path;
  std::shared_ptr<ISecretProtector> protector;
  /// Runs after the temp file is durable and before it is renamed into place. A failure
  /// aborts the commit and leaves the temp file behind, as a crash at that point would.
  std::function<common::Status(const std::filesystem::path &temp)> before_replace;
};

/// Encrypted key/value store backed by a single file that is rewritten wholesale and
/// atomically on every mutation.
class CredentialStore {
public:
  explicit CredentialStore(CredentialStoreOptions options);

  [[nodiscard]] common::Status store(const std::string &key, const std::string &value);
  [[nodiscard]] common::Result<std::optional<std::string>> retrieve(const std::string &key) const;
  /// True when the key existed.
  [[nodiscard]] common::Result<bool> remove(const std::string &key);
  [[nodiscard]] std::vector<std::string> list_keys() const;
  [[nodiscard]] common::Status clear();

  [[nodiscard]] const std::filesystem::path &path() const { return options_.path; }

private:
  using BlobMap = std::map<std::string, std::string>;

  [[nodiscard]] BlobMap read_blobs() const;
  [[nodiscard]] common::Status write_blobs(const BlobMap &blobs);

  CredentialStoreOptions options_;
  mutable std::shared_mutex mutex_;
};

} // namespace hostgate::security
