#pragma once

#include "hostgate/common/fs.hpp"
#include "hostgate/security/path_policy.hpp"
#include "hostgate/tools/tool.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace hostgate::tools::builtin::file_internal {

inline common::Result<ToolResult> refuse(std::string reason, const common::ErrorCode kind) {
  return common::Result<ToolResult>::success(ToolResult::fail(std::move(reason), kind));
}

inline common::Result<ToolResult> deny(const security::SecurityDecision &decision) {
  return refuse(decision.reason.value_or("Access denied"), common::ErrorCode::SecurityDenied);
}

inline common::Result<ToolResult> done(std::string output) {
  return common::Result<ToolResult>::success(ToolResult::ok(std::move(output)));
}

/// Present after dispatcher validation for required string parameters.
inline std::string path_arg(const ToolArgs &args, const std::string &key = "path") {
  return get_string(args, key).value_or("");
}

inline std::filesystem::path to_path(const std::string &raw) {
  return std::filesystem::path(common::expand_path(raw));
}

inline bool is_existing_file(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

inline std::uintmax_t existing_size(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : size;
}

/// Missing files, oversized files and I/O errors come back as a ready-made refusal.
struct LoadedFile {
  std::optional<std::string> bytes;
  std::optional<common::Result<ToolResult>> refusal;
};

inline LoadedFile load_bounded(const std::string &raw, const std::filesystem::path &path) {
  if (!is_existing_file(path)) {
    return {std::nullopt, refuse("File not found: " + raw, common::ErrorCode::NotFound)};
  }
  if (const auto size = security::check_read_size(path); !size.allowed) {
    return {std::nullopt, deny(size)};
  }
  auto bytes = common::read_file_bytes(path);
  if (!bytes.ok()) {
    return {std::nullopt, common::Result<ToolResult>::failure(bytes.error(), bytes.code())};
  }
  return {std::move(bytes.value()), std::nullopt};
}

inline std::string byte_count(const std::size_t n) {
  return std::to_string(n) + (n == 1 ? " byte" : " bytes");
}

} // namespace hostgate::tools::builtin::file_internal
