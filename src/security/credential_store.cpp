#include "hostgate/security/credential_store.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/json_util.hpp"
#include "hostgate/observability/global.hpp"

#include <mutex>
#include <sstream>

namespace hostgate::security {

namespace {

constexpr const char *COMPONENT = "credential_store";

common::Status validate_key(const std::string &key) {
  if (common::trim(key).empty()) {
    return common::Status::error("Credential key must not be empty",
                                 common::ErrorCode::Validation);
  }
  return common::Status::success();
}

} // namespace

CredentialStore::CredentialStore(CredentialStoreOptions options) : options_(std::move(options)) {}

CredentialStore::BlobMap CredentialStore::read_blobs() const {
  BlobMap blobs;
  std::error_code ec;
  if (!std::filesystem::exists(options_.path, ec)) {
    return blobs;
  }

  const auto raw = common::read_file_bytes(options_.path);
  if (!raw.ok()) {
    observability::record_error(COMPONENT, "unreadable store, treating as empty: " + raw.error());
    return blobs;
  }

  const std::string content = common::trim(raw.value());
  if (content.empty()) {
    return blobs;
  }
  if (content.front() != '{' || content.back() != '}') {
    observability::record_error(COMPONENT,
                                "corrupt store, treating as empty: " + options_.path.string());
    return blobs;
  }

  for (const auto &[key, token] : common::json_parse_flat_typed(content)) {
    if (token.kind != common::JsonKind::String) {
      observability::record_error(COMPONENT, "skipping malformed entry: " + key);
      continue;
    }
    blobs.emplace(key, token.text);
  }
  return blobs;
}

common::Status CredentialStore::write_blobs(const BlobMap &blobs) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[key, blob] : blobs) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << "\"" << common::json_escape(key) << "\":\"" << common::json_escape(blob) << "\"";
  }
  out << "}\n";

  auto temp = common::write_temp_sibling(options_.path, out.str(), 0600);
  if (!temp.ok()) {
    return common::Status::error(temp.error(), common::ErrorCode::Persistence);
  }
  if (options_.before_replace) {
    if (auto hook = options_.before_replace(temp.value()); !hook.ok()) {
      return common::Status::error("Commit interrupted: " + hook.error(),
                                   common::ErrorCode::Persistence);
    }
  }
  return common::commit_temp_file(temp.value(), options_.path);
}

common::Status CredentialStore::store(const std::string &key, const std::string &value) {
  if (auto valid = validate_key(key); !valid.ok()) {
    return valid;
  }
  if (common::trim(value).empty()) {
    return common::Status::error("Credential value must not be empty",
                                 common::ErrorCode::Validation);
  }
  if (options_.protector == nullptr) {
    return common::Status::error("No secret protector configured");
  }

  const auto protected_blob = options_.protector->protect(value);
  if (!protected_blob.ok()) {
    return protected_blob.status();
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto blobs = read_blobs();
  blobs[key] = base64_encode(protected_blob.value());
  return write_blobs(blobs);
}

common::Result<std::optional<std::string>> CredentialStore::retrieve(const std::string &key) const {
  using R = common::Result<std::optional<std::string>>;
  if (auto valid = validate_key(key); !valid.ok()) {
    return R::failure(valid);
  }

  std::string encoded;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto blobs = read_blobs();
    const auto it = blobs.find(key);
    if (it == blobs.end()) {
      return R::success(std::nullopt);
    }
    encoded = it->second;
  }

  const auto blob = base64_decode(encoded);
  if (!blob.ok()) {
    return R::failure("Stored credential is not valid base64: " + key,
                      common::ErrorCode::Persistence);
  }
  if (options_.protector == nullptr) {
    return R::failure("No secret protector configured");
  }
  const auto plain = options_.protector->unprotect(blob.value());
  if (!plain.ok()) {
    return R::failure("Unable to unprotect credential '" + key + "': " + plain.error(),
                      plain.code());
  }
  return R::success(plain.value());
}

common::Result<bool> CredentialStore::remove(const std::string &key) {
  if (auto valid = validate_key(key); !valid.ok()) {
    return common::Result<bool>::failure(valid);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto blobs = read_blobs();
  if (blobs.erase(key) == 0) {
    return common::Result<bool>::success(false);
  }
  if (auto written = write_blobs(blobs); !written.ok()) {
    return common::Result<bool>::failure(written);
  }
  return common::Result<bool>::success(true);
}

std::vector<std::string> CredentialStore::list_keys() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> keys;
  for (const auto &[key, blob] : read_blobs()) {
    keys.push_back(key);
  }
  return keys;
}

common::Status CredentialStore::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return write_blobs({});
}

} // namespace hostgate::security
