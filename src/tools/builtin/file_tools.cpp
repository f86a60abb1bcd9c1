#include "hostgate/tools/builtin/file_tools.hpp"

#include "file_internal.hpp"

#include <algorithm>
#include <filesystem>

namespace hostgate::tools {

using namespace builtin::file_internal;

std::string_view ReadFileTool::name() const { return "read_file"; }

std::string_view ReadFileTool::description() const {
  return "Read the contents of a file (at most 10 MB)";
}

std::vector<ParamSpec> ReadFileTool::parameters() const {
  return {{.name = "path", .type = ParamType::String, .required = true,
           .description = "File to read"}};
}

common::Result<ToolResult> ReadFileTool::execute(const ToolArgs &args, const ToolContext &) {
  const std::string raw = path_arg(args);
  if (common::trim(raw).empty()) {
    return refuse("Parameter 'path' must not be empty", common::ErrorCode::Validation);
  }

  auto loaded = load_bounded(raw, to_path(raw));
  if (loaded.refusal.has_value()) {
    return std::move(*loaded.refusal);
  }
  return done(std::move(*loaded.bytes));
}

bool ReadFileTool::is_safe() const { return true; }

std::string_view ReadFileTool::group() const { return "fs"; }

std::string_view WriteFileTool::name() const { return "write_file"; }

std::string_view WriteFileTool::description() const {
  return "Write content to a file, replacing it atomically";
}

std::vector<ParamSpec> WriteFileTool::parameters() const {
  return {{.name = "path", .type = ParamType::String, .required = true,
           .description = "File to write"},
          {.name = "content", .type = ParamType::String, .required = true,
           .description = "New file content"}};
}

common::Result<ToolResult> WriteFileTool::execute(const ToolArgs &args, const ToolContext &) {
  const std::string raw = path_arg(args);
  const std::string content = path_arg(args, "content");
  const auto path = to_path(raw);

  if (const auto access = security::check_path_access(path.string()); !access.allowed) {
    return deny(access);
  }
  if (const auto size = security::check_content_size(content.size(), raw); !size.allowed) {
    return deny(size);
  }

  if (const auto written = common::atomic_write_file(path, content); !written.ok()) {
    return common::Result<ToolResult>::failure(written.error(), written.code());
  }
  return done("Wrote " + byte_count(content.size()) + " to " + raw);
}

bool WriteFileTool::is_safe() const { return false; }

std::string_view WriteFileTool::group() const { return "fs"; }

std::string_view ListDirectoryTool::name() const { return "list_directory"; }

std::string_view ListDirectoryTool::description() const {
  return "List the entries of a directory, one per line";
}

std::vector<ParamSpec> ListDirectoryTool::parameters() const {
  return {{.name = "path", .type = ParamType::String, .required = true,
           .description = "Directory to list"}};
}

common::Result<ToolResult> ListDirectoryTool::execute(const ToolArgs &args, const ToolContext &) {
  const std::string raw = path_arg(args);
  const auto path = to_path(raw);

  std::error_code ec;
  if (common::trim(raw).empty() || !std::filesystem::is_directory(path, ec)) {
    return refuse("Directory not found: " + raw, common::ErrorCode::NotFound);
  }

  std::vector<std::pair<std::string, bool>> entries;
  for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    entries.emplace_back(it->path().filename().string(), it->is_directory(type_ec));
  }
  if (ec) {
    return common::Result<ToolResult>::failure("Failed to list directory " + raw + ": " +
                                               ec.message());
  }

  std::sort(entries.begin(), entries.end());
  std::string output;
  for (const auto &[entry, is_dir] : entries) {
    if (!output.empty()) {
      output += "\n";
    }
    output += (is_dir ? "[DIR] " : "[FILE] ") + entry;
  }
  if (output.empty()) {
    output = "(empty directory)";
  }
  return done(std::move(output));
}

bool ListDirectoryTool::is_safe() const { return true; }

std::string_view ListDirectoryTool::group() const { return "fs"; }

} // namespace hostgate::tools
