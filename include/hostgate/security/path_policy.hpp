#pragma once

#include "hostgate/security/command_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace hostgate::security {

/// Read ceiling for file tools, and write ceiling for the content they produce.
inline constexpr std::uintmax_t kMaxFileBytes = 10ULL * 1024ULL * 1024ULL;

/// True for blank paths and for anything at or below a protected system root. Both the raw
/// text (backslashes folded to '/', lower-cased) and its absolute form are checked.
[[nodiscard]] bool is_blocked_path(const std::string &path);

[[nodiscard]] SecurityDecision check_path_access(const std::string &path);
/// Existing files larger than kMaxFileBytes are denied. Missing files pass; the read reports them.
[[nodiscard]] SecurityDecision check_read_size(const std::filesystem::path &path);
[[nodiscard]] SecurityDecision check_content_size(std::uintmax_t bytes, const std::string &path);

} // namespace hostgate::security
