#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace hostgate::security {

struct SecurityDecision {
  bool allowed = true;
  /// Present iff denied.
  std::optional<std::string> reason;

  [[nodiscard]] static SecurityDecision allow() { return {}; }
  [[nodiscard]] static SecurityDecision deny(std::string why) {
    return SecurityDecision{.allowed = false, .reason = std::move(why)};
  }
};

/// Longest `path + " " + arguments` the evaluator accepts; the cmd.exe command-line limit.
inline constexpr std::size_t kMaxCommandLineLength = 8191;

/// Final path component, split on both '/' and '\', lower-cased.
[[nodiscard]] std::string executable_name(std::string_view path);

/// Fixed deny-list evaluation of a process launch. Pure: the same input always yields the
/// same decision and nothing on the host is touched. Checks, first failure wins:
///   1. the executable name against the blocked-executable list
///   2. `path + " " + arguments`: longer than kMaxCommandLineLength is denied, otherwise it is
///      matched against destructive command-line signatures
///   3. for shell and script hosts, a substring deny-list over `arguments`
[[nodiscard]] SecurityDecision evaluate_command(std::string_view path, std::string_view arguments);

[[nodiscard]] bool is_blocked_executable(std::string_view name);
[[nodiscard]] bool is_shell_host(std::string_view name);

} // namespace hostgate::security
