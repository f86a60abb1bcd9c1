#include "hostgate/security/path_policy.hpp"

#include "hostgate/common/fs.hpp"

#include <algorithm>
#include <array>

namespace hostgate::security {

namespace {

constexpr std::array<const char *, 25> kBlockedRoots = {
    "C:\\Windows",
    "C:\\Program Files",
    "C:\\Program Files (x86)",
    "C:\\ProgramData",
    "C:\\Users\\All Users",
    "C:\\Users\\Default",
    "C:\\Users\\Public",
    "C:\\$Recycle.Bin",
    "C:\\System Volume Information",
    "C:\\Boot",
    "C:\\Config.Msi",
    "C:\\Recovery",
    "C:\\inetpub",
    "/etc",
    "/bin",
    "/sbin",
    "/usr/bin",
    "/usr/sbin",
    "/var/log",
    "/var/spool",
    "/proc",
    "/sys",
    "/dev",
    "/boot",
    "/root",
};

std::string fold(std::string value) {
  std::replace(value.begin(), value.end(), '\\', '/');
  return common::to_lower(std::move(value));
}

bool under_blocked_root(const std::filesystem::path &candidate) {
  return std::any_of(kBlockedRoots.begin(), kBlockedRoots.end(), [&candidate](const char *root) {
    return common::is_subpath(candidate, std::filesystem::path(fold(root)));
  });
}

std::string megabytes(const std::uintmax_t bytes) {
  return std::to_string(bytes / (1024ULL * 1024ULL)) + " MB";
}

} // namespace

bool is_blocked_path(const std::string &path) {
  if (common::trim(path).empty()) {
    return true;
  }

  const std::filesystem::path raw(fold(path));
  if (under_blocked_root(raw.lexically_normal())) {
    return true;
  }

  std::error_code ec;
  const auto absolute = std::filesystem::absolute(std::filesystem::path(path), ec);
  if (!ec && under_blocked_root(std::filesystem::path(fold(absolute.lexically_normal().string())))) {
    return true;
  }

  const auto resolved = std::filesystem::weakly_canonical(std::filesystem::path(path), ec);
  return !ec && under_blocked_root(std::filesystem::path(fold(resolved.string())));
}

SecurityDecision check_path_access(const std::string &path) {
  if (is_blocked_path(path)) {
    return SecurityDecision::deny("Access denied: '" + path + "' is a disallowed system path");
  }
  return SecurityDecision::allow();
}

SecurityDecision check_read_size(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return SecurityDecision::allow();
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (!ec && size > kMaxFileBytes) {
    return SecurityDecision::deny("File '" + path.string() + "' (" + megabytes(size) +
                                  ") exceeds the 10 MB size limit");
  }
  return SecurityDecision::allow();
}

SecurityDecision check_content_size(const std::uintmax_t bytes, const std::string &path) {
  if (bytes > kMaxFileBytes) {
    return SecurityDecision::deny("Content for '" + path + "' (" + megabytes(bytes) +
                                  ") exceeds the 10 MB size limit");
  }
  return SecurityDecision::allow();
}

} // namespace hostgate::security
