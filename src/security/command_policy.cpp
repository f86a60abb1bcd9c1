#include "hostgate/security/command_policy.hpp"

#include "hostgate/common/fs.hpp"

#include <algorithm>
#include <array>
#include <regex>

namespace hostgate::security {

namespace {

constexpr std::array<std::string_view, 42> kBlockedExecutables = {
    // registry
    "regedit.exe", "reg.exe",
    // partitioning and formatting
    "format.com", "diskpart.exe", "fdisk", "sfdisk", "parted", "wipefs",
    // backups and shadow copies
    "vssadmin.exe", "wbadmin.exe",
    // boot configuration
    "bcdedit.exe", "bootrec.exe", "efibootmgr", "grub-install",
    // ACLs and ownership
    "takeown.exe", "icacls.exe", "cacls.exe", "attrib.exe", "chown", "chattr", "setfacl",
    // accounts
    "net.exe", "net1.exe", "useradd", "userdel", "usermod", "passwd", "chpasswd", "visudo",
    // services and scheduling
    "sc.exe", "schtasks.exe", "at.exe", "crontab",
    // low-level disk and crypto
    "fsutil.exe", "cipher.exe", "shred", "blkdiscard",
    // legacy debuggers
    "debug.exe", "edlin.exe", "debug64.exe", "edlin64.exe", "mkswap"};

// mkfs, mkfs.ext4, mkfs.vfat, ...
constexpr std::array<std::string_view, 1> kBlockedExecutablePrefixes = {"mkfs"};

constexpr std::array<std::string_view, 14> kShellHosts = {
    "cmd.exe", "powershell.exe", "pwsh.exe", "pwsh",        "sh",          "bash",
    "zsh",     "dash",           "ksh",      "fish",        "wscript.exe", "cscript.exe",
    "cmd",     "powershell"};

constexpr std::array<std::string_view, 38> kDangerousShellOperations = {
    "del ",       "erase ",      "rmdir ",        "rd ",        "format ",    "diskpart",
    "reg delete", "reg add",     "net user",      "net localgroup", "takeown", "icacls",
    "attrib -r -s -h", "fsutil", "cipher",        "vssadmin",   "wbadmin",    "bcdedit",
    "bootrec",    ">nul",        "2>&1",          "remove-item", "rm ",       "unlink ",
    "shred",      "mkfs",        "dd if=",        "of=/dev/",   "wipefs",     "useradd",
    "userdel",    "usermod",     "passwd",        "chown",      "chmod ",     "setfacl",
    "crontab",    "> /dev/sd"};

struct DangerousPattern {
  const char *label;
  std::regex regex;
};

const std::array<DangerousPattern, 25> &dangerous_patterns() {
  static const auto flags = std::regex::ECMAScript | std::regex::icase;
  static const std::array<DangerousPattern, 25> patterns = {
      DangerousPattern{"forced delete on system drive", std::regex(R"(del\s+/[fq]\s+.*C:\\)", flags)},
      DangerousPattern{"recursive rmdir on system drive",
                       std::regex(R"(rmdir\s+/[sq]\s+.*C:\\)", flags)},
      DangerousPattern{"recursive delete of root",
                       std::regex(R"(rm\s+(-[a-z]*\s+)*-[a-z]*r[a-z]*\s+(-[a-z]*\s+)*/(\s|\*|$))",
                                  flags)},
      DangerousPattern{"format", std::regex(R"(format\s+)", flags)},
      DangerousPattern{"diskpart", std::regex(R"(diskpart)", flags)},
      DangerousPattern{"registry delete", std::regex(R"(reg\s+delete)", flags)},
      DangerousPattern{"user management", std::regex(R"(net\s+user)", flags)},
      DangerousPattern{"group management", std::regex(R"(net\s+localgroup)", flags)},
      DangerousPattern{"ownership grab", std::regex(R"(takeown)", flags)},
      DangerousPattern{"administrators grant",
                       std::regex(R"(icacls.*/grant.*administrators)", flags)},
      DangerousPattern{"encoded powershell", std::regex(R"(powershell.*-EncodedCommand)", flags)},
      DangerousPattern{"encoded powershell", std::regex(R"(powershell.*-enc)", flags)},
      DangerousPattern{"powershell IEX", std::regex(R"(powershell.*IEX)", flags)},
      DangerousPattern{"powershell Invoke-Expression",
                       std::regex(R"(powershell.*Invoke-Expression)", flags)},
      DangerousPattern{"decoded payload piped to shell",
                       std::regex(R"(base64\s+(-d|--decode).*\|\s*(ba|z|da|k)?sh\b)", flags)},
      DangerousPattern{"chained cmd delete", std::regex(R"(cmd.*/c.*del)", flags)},
      DangerousPattern{"chained cmd delete", std::regex(R"(cmd.*/k.*del)", flags)},
      DangerousPattern{"silenced delete", std::regex(R"(>.*nul.*2>&1.*del)", flags)},
      DangerousPattern{"zero fill", std::regex(R"(fsutil\s+file\s+setzerodata)", flags)},
      DangerousPattern{"free space wipe", std::regex(R"(cipher\s+/w)", flags)},
      DangerousPattern{"raw device write", std::regex(R"(\bdd\s+.*of=/dev/)", flags)},
      DangerousPattern{"shadow copy delete", std::regex(R"(vssadmin\s+delete)", flags)},
      DangerousPattern{"backup delete", std::regex(R"(wbadmin\s+delete)", flags)},
      DangerousPattern{"boot configuration", std::regex(R"(bcdedit)", flags)},
      DangerousPattern{"boot record", std::regex(R"(bootrec)", flags)},
  };
  return patterns;
}

template <std::size_t N>
bool contains(const std::array<std::string_view, N> &list, const std::string_view value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

std::string executable_name(const std::string_view path) {
  std::string trimmed = common::trim(std::string(path));
  while (!trimmed.empty() && (trimmed.back() == '/' || trimmed.back() == '\\')) {
    trimmed.pop_back();
  }
  const auto separator = trimmed.find_last_of("/\\");
  const std::string name =
      separator == std::string::npos ? trimmed : trimmed.substr(separator + 1);
  return common::to_lower(name);
}

bool is_blocked_executable(const std::string_view name) {
  if (contains(kBlockedExecutables, name)) {
    return true;
  }
  return std::any_of(kBlockedExecutablePrefixes.begin(), kBlockedExecutablePrefixes.end(),
                     [name](const std::string_view prefix) { return name.starts_with(prefix); });
}

bool is_shell_host(const std::string_view name) { return contains(kShellHosts, name); }

SecurityDecision evaluate_command(const std::string_view path, const std::string_view arguments) {
  const std::string name = executable_name(path);
  if (is_blocked_executable(name)) {
    return SecurityDecision::deny("Blocked executable: '" + name +
                                  "' can cause irreversible system changes");
  }

  const std::string full_command = std::string(path) + " " + std::string(arguments);
  if (full_command.size() > kMaxCommandLineLength) {
    return SecurityDecision::deny("Command line is longer than " +
                                  std::to_string(kMaxCommandLineLength) + " characters");
  }
  for (const auto &pattern : dangerous_patterns()) {
    if (std::regex_search(full_command, pattern.regex)) {
      return SecurityDecision::deny(std::string("Dangerous command pattern detected (") +
                                    pattern.label + ")");
    }
  }

  if (is_shell_host(name)) {
    const std::string lowered = common::to_lower(std::string(arguments));
    for (const auto operation : kDangerousShellOperations) {
      if (lowered.find(operation) != std::string::npos) {
        return SecurityDecision::deny("Command contains a dangerous shell operation: '" +
                                      std::string(operation) + "'");
      }
    }
  }

  return SecurityDecision::allow();
}

} // namespace hostgate::security
