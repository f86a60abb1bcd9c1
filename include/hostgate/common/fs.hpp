#pragma once

#include "hostgate/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hostgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

[[nodiscard]] Result<std::string> read_file_bytes(const std::filesystem::path &path);

/// First half of an atomic replace: a uniquely named, fsynced sibling of `target`.
[[nodiscard]] Result<std::filesystem::path> write_temp_sibling(const std::filesystem::path &target,
                                                               const std::string &content,
                                                               unsigned int mode = 0644);
/// Second half: rename(2) `temp` over `target` and fsync the parent directory.
[[nodiscard]] Status commit_temp_file(const std::filesystem::path &temp,
                                      const std::filesystem::path &target);

/// Writes `content` to a sibling temp file, fsyncs it and renames it over `target`.
/// Readers of `target` observe either the previous bytes or the new bytes, never a mix.
[[nodiscard]] Status atomic_write_file(const std::filesystem::path &target,
                                       const std::string &content,
                                       unsigned int mode = 0644);

} // namespace hostgate::common
