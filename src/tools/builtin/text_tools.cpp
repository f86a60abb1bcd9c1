#include "hostgate/tools/builtin/text_tools.hpp"

#include "file_internal.hpp"
#include "hostgate/common/encoding.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <regex>
#include <unistd.h>

namespace hostgate::tools {

using namespace builtin::file_internal;

namespace {

ParamSpec path_param(std::string description) {
  return {.name = "path", .type = ParamType::String, .required = true,
          .description = std::move(description)};
}

ParamSpec encoding_param() {
  return {.name = "encoding", .type = ParamType::String, .required = false,
          .description = "Text encoding (utf-8, utf-16, utf-32, ascii, shift-jis, euc-jp, "
                         "iso-2022-jp, latin1). Defaults to utf-8"};
}

ParamSpec flag_param(std::string name, std::string description) {
  return {.name = std::move(name), .type = ParamType::Boolean, .required = false,
          .description = std::move(description)};
}

std::string encoding_arg(const ToolArgs &args) { return get_string(args, "encoding").value_or(""); }

/// Validation failures of the encoding itself are reported to the caller as such.
common::Result<ToolResult> conversion_failed(const common::Status &status) {
  return refuse(status.error(), status.code());
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '\r' || ch == '\n') {
      lines.push_back(std::move(current));
      current.clear();
      if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    current.push_back(ch);
  }
  lines.push_back(std::move(current));
  return lines;
}

// std::regex matches recursively; stack use grows with the pattern and the subject line.
constexpr std::size_t kMaxRegexPatternLength = 1024;
constexpr std::size_t kMaxRegexLineLength = 4096;

std::string line_too_long(const std::size_t line_number) {
  return "Line " + std::to_string(line_number) + " is longer than " +
         std::to_string(kMaxRegexLineLength) +
         " characters; regular expressions only run on shorter lines";
}

common::Result<std::regex> compile_pattern(const std::string &pattern) {
  if (pattern.size() > kMaxRegexPatternLength) {
    return common::Result<std::regex>::failure(
        "Regular expression is longer than " + std::to_string(kMaxRegexPatternLength) +
            " characters",
        common::ErrorCode::Validation);
  }
  try {
    return common::Result<std::regex>::success(std::regex(pattern, std::regex::ECMAScript));
  } catch (const std::regex_error &e) {
    return common::Result<std::regex>::failure("Invalid regular expression '" + pattern +
                                                   "': " + e.what(),
                                               common::ErrorCode::Validation);
  }
}

common::Status append_bytes(const std::filesystem::path &path, const std::string &bytes) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    return common::Status::error("Failed to open " + path.string() + " for append: " +
                                 std::strerror(errno));
  }
  std::size_t written = 0;
  while (written < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string reason = std::strerror(errno);
      static_cast<void>(::close(fd));
      return common::Status::error("Failed to append to " + path.string() + ": " + reason);
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0 || ::close(fd) != 0) {
    return common::Status::error("Failed to flush " + path.string() + ": " +
                                 std::strerror(errno));
  }
  return common::Status::success();
}

/// Replaces within each line. Line terminators are copied through untouched.
common::Result<std::string> regex_replace_lines(const std::string &content, const std::regex &regex,
                                                const std::string &replacement,
                                                std::size_t &count) {
  std::string out;
  out.reserve(content.size());
  std::size_t line_number = 0;
  std::size_t pos = 0;
  while (pos < content.size()) {
    ++line_number;
    const auto eol = content.find_first_of("\r\n", pos);
    const auto body_end = eol == std::string::npos ? content.size() : eol;
    if (body_end - pos > kMaxRegexLineLength) {
      return common::Result<std::string>::failure(line_too_long(line_number),
                                                  common::ErrorCode::Validation);
    }
    const std::string body = content.substr(pos, body_end - pos);
    count += static_cast<std::size_t>(std::distance(
        std::sregex_iterator(body.begin(), body.end(), regex), std::sregex_iterator()));
    out += std::regex_replace(body, regex, replacement);
    if (eol == std::string::npos) {
      break;
    }
    std::size_t next = eol + 1;
    if (content[eol] == '\r' && next < content.size() && content[next] == '\n') {
      ++next;
    }
    out.append(content, eol, next - eol);
    pos = next;
  }
  return common::Result<std::string>::success(std::move(out));
}

std::filesystem::path backup_path_for(const std::filesystem::path &path) {
  return std::filesystem::path(path.string() + ".backup");
}

} // namespace

// read_text_file

std::string_view ReadTextFileTool::name() const { return "read_text_file"; }

std::string_view ReadTextFileTool::description() const {
  return "Read a text file in the given encoding and return it as UTF-8";
}

std::vector<ParamSpec> ReadTextFileTool::parameters() const {
  return {path_param("Text file to read"), encoding_param()};
}

common::Result<ToolResult> ReadTextFileTool::execute(const ToolArgs &args, const ToolContext &) {
  const std::string raw = path_arg(args);
  const auto path = to_path(raw);
  if (const auto access = security::check_path_access(path.string()); !access.allowed) {
    return deny(access);
  }

  auto loaded = load_bounded(raw, path);
  if (loaded.refusal.has_value()) {
    return std::move(*loaded.refusal);
  }
  auto text = common::decode_to_utf8(*loaded.bytes, encoding_arg(args));
  if (!text.ok()) {
    return conversion_failed(text.status());
  }
  return done(std::move(text.value()));
}

bool ReadTextFileTool::is_safe() const { return true; }

std::string_view ReadTextFileTool::group() const { return "text"; }

// write_text_file

std::string_view WriteTextFileTool::name() const { return "write_text_file"; }

std::string_view WriteTextFileTool::description() const {
  return "Write text to a file in the given encoding, optionally keeping a .backup copy";
}

std::vector<ParamSpec> WriteTextFileTool::parameters() const {
  return {path_param("Text file to write"),
          {.name = "content", .type = ParamType::String, .required = true,
           .description = "New file content"},
          encoding_param(),
          flag_param("create_backup", "Copy the existing file to <path>.backup first")};
}

common::Result<ToolResult> WriteTextFileTool::execute(const ToolArgs &args, const ToolContext &) {
  const std::string raw = path_arg(args);
  const auto path = to_path(raw);
  if (const auto access = security::check_path_access(path.string()); !access.allowed) {
    return deny(access);
  }

  auto encoded = common::encode_from_utf8(path_arg(args, "content"), encoding_arg(args));
  if (!encoded.ok()) {
    return conversion_failed(encoded.status());
  }
  if (const auto size = security::check_content_size(encoded.value().size(), raw); !size.allowed) {
    return deny(size);
  }

  std::string note;
  if (get_bool(args, "create_backup", false) && is_existing_file(path)) {
    auto previous = load_bounded(raw, path);
    if (previous.refusal.has_value()) {
      return std::move(*previous.refusal);
    }
    const auto backup = backup_path_for(path);
    if (const auto saved = common::atomic_write_file(backup, *previous.bytes); !saved.ok()) {
      return common::Result<ToolResult>::failure(saved.error(), saved.code());
    }
    note = " (backup: " + backup.string() + ")";
  }

  if (const auto written = common::atomic_write_file(path, encoded.value()); !written.ok()) {
    return common::Result<ToolResult>::failure(written.error(), written.code());
  }
  return done("Wrote " + byte_count(encoded.value().size()) + " to " + raw + note);
}

bool WriteTextFileTool::is_safe() const { return false; }

std::string_view WriteTextFileTool::group() const { return "text"; }

// append_to_file

std::string_view AppendToFileTool::name() const { return "append_to_file"; }

std::string_view AppendToFileTool::description() const {
  return "Append text to the end of a file, creating it when missing";
}

std::vector<ParamSpec> AppendToFileTool::parameters() const {
  return {path_param("Text file to append to"),
          {.name = "content", .type = ParamType::String, .required = true,
           .description = "Text to append"},
          encoding_param()};
}

common::Result<ToolResult> AppendToFileTool::execute(const ToolArgs &args, const ToolContext &) {
  const std::string raw = path_arg(args);
  const auto path = to_path(raw);
  if (const auto access = security::check_path_access(path.string()); !access.allowed) {
    return deny(access);
  }

  auto encoded = common::encode_from_utf8(path_arg(args, "content"), encoding_arg(args));
  if (!encoded.ok()) {
    return conversion_failed(encoded.status());
  }
  const auto combined = existing_size(path) + encoded.value().size();
  if (const auto size = security::check_content_size(combined, raw); !size.allowed) {
    return deny(size);
  }

  if (path.has_parent_path()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return common::Result<ToolResult>::failure(dir.error(), dir.code());
    }
  }
  if (const auto appended = append_bytes(path, encoded.value()); !appended.ok()) {
    return common::Result<ToolResult>::failure(appended.error(), appended.code());
  }
  return done("Appended " + byte_count(encoded.value().size()) + " to " + raw);
}

bool AppendToFileTool::is_safe() const { return false; }

std::string_view AppendToFileTool::group() const { return "text"; }

// search_in_file

std::string_view SearchInFileTool::name() const { return "search_in_file"; }

std::string_view SearchInFileTool::description() const {
  return "List the lines of a text file that contain a pattern";
}

std::vector<ParamSpec> SearchInFileTool::parameters() const {
  return {path_param("Text file to search"),
          {.name = "pattern", .type = ParamType::String, .required = true,
           .description = "Substring (case-insensitive) or regular expression"},
          flag_param("use_regex", "Treat pattern as an ECMAScript regular expression"),
          encoding_param()};
}

common::Result<ToolResult> SearchInFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const std::string raw = path_arg(args);
  const auto path = to_path(raw);
  if (const auto access = security::check_path_access(path.string()); !access.allowed) {
    return deny(access);
  }

  const std::string pattern = path_arg(args, "pattern");
  const bool use_regex = get_bool(args, "use_regex", false);
  std::optional<std::regex> regex;
  if (use_regex) {
    auto compiled = compile_pattern(pattern);
    if (!compiled.ok()) {
      return refuse(compiled.error(), compiled.code());
    }
    regex = std::move(compiled.value());
  }

  auto loaded = load_bounded(raw, path);
  if (loaded.refusal.has_value()) {
    return std::move(*loaded.refusal);
  }
  auto text = common::decode_to_utf8(*loaded.bytes, encoding_arg(args));
  if (!text.ok()) {
    return conversion_failed(text.status());
  }

  const std::string needle = common::to_lower(pattern);
  const auto lines = split_lines(text.value());
  std::vector<std::string> matches;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (ctx.cancel.is_cancelled()) {
      return refuse("Search cancelled", common::ErrorCode::Cancelled);
    }
    if (regex.has_value() && lines[i].size() > kMaxRegexLineLength) {
      return refuse(line_too_long(i + 1), common::ErrorCode::Validation);
    }
    const bool hit = regex.has_value() ? std::regex_search(lines[i], *regex)
                                       : common::to_lower(lines[i]).find(needle) != std::string::npos;
    if (hit) {
      matches.push_back("Line " + std::to_string(i + 1) + ": " + lines[i]);
    }
  }

  if (matches.empty()) {
    return done("No matching lines found");
  }
  std::string output = "Found " + std::to_string(matches.size()) + " matching line" +
                       (matches.size() == 1 ? "" : "s") + ":";
  for (const auto &match : matches) {
    output += "\n" + match;
  }
  return done(std::move(output));
}

bool SearchInFileTool::is_safe() const { return true; }

std::string_view SearchInFileTool::group() const { return "text"; }

// replace_in_file

std::string_view ReplaceInFileTool::name() const { return "replace_in_file"; }

std::string_view ReplaceInFileTool::description() const {
  return "Replace every occurrence of a text or regular expression in a file";
}

std::vector<ParamSpec> ReplaceInFileTool::parameters() const {
  return {path_param("Text file to edit"),
          {.name = "old_text", .type = ParamType::String, .required = true,
           .description = "Text or regular expression to replace"},
          {.name = "new_text", .type = ParamType::String, .required = true,
           .description = "Replacement text"},
          flag_param("use_regex",
                     "Treat old_text as an ECMAScript regular expression, applied line by line"),
          flag_param("create_backup", "Keep the original file as <path>.backup"),
          encoding_param()};
}

common::Result<ToolResult> ReplaceInFileTool::execute(const ToolArgs &args, const ToolContext &) {
  const std::string raw = path_arg(args);
  const auto path = to_path(raw);
  if (const auto access = security::check_path_access(path.string()); !access.allowed) {
    return deny(access);
  }

  const std::string old_text = path_arg(args, "old_text");
  const std::string new_text = path_arg(args, "new_text");
  if (old_text.empty()) {
    return refuse("Parameter 'old_text' must not be empty", common::ErrorCode::Validation);
  }

  auto loaded = load_bounded(raw, path);
  if (loaded.refusal.has_value()) {
    return std::move(*loaded.refusal);
  }
  const std::string encoding = encoding_arg(args);
  auto text = common::decode_to_utf8(*loaded.bytes, encoding);
  if (!text.ok()) {
    return conversion_failed(text.status());
  }
  const std::string &content = text.value();

  std::size_t count = 0;
  std::string replaced;
  if (get_bool(args, "use_regex", false)) {
    auto compiled = compile_pattern(old_text);
    if (!compiled.ok()) {
      return refuse(compiled.error(), compiled.code());
    }
    auto lines = regex_replace_lines(content, compiled.value(), new_text, count);
    if (!lines.ok()) {
      return refuse(lines.error(), lines.code());
    }
    replaced = std::move(lines.value());
  } else {
    std::size_t pos = 0;
    while (true) {
      const auto found = content.find(old_text, pos);
      if (found == std::string::npos) {
        replaced.append(content, pos, std::string::npos);
        break;
      }
      replaced.append(content, pos, found - pos);
      replaced += new_text;
      pos = found + old_text.size();
      ++count;
    }
  }

  if (count == 0) {
    return done("No occurrences found in " + raw);
  }

  auto encoded = common::encode_from_utf8(replaced, encoding);
  if (!encoded.ok()) {
    return conversion_failed(encoded.status());
  }
  if (const auto size = security::check_content_size(encoded.value().size(), raw); !size.allowed) {
    return deny(size);
  }

  if (get_bool(args, "create_backup", false)) {
    if (const auto saved = common::atomic_write_file(backup_path_for(path), *loaded.bytes);
        !saved.ok()) {
      return common::Result<ToolResult>::failure(saved.error(), saved.code());
    }
  }
  if (const auto written = common::atomic_write_file(path, encoded.value()); !written.ok()) {
    return common::Result<ToolResult>::failure(written.error(), written.code());
  }
  return done("Replaced " + std::to_string(count) + " occurrence" + (count == 1 ? "" : "s") +
              " in " + raw);
}

bool ReplaceInFileTool::is_safe() const { return false; }

std::string_view ReplaceInFileTool::group() const { return "text"; }

} // namespace hostgate::tools
