#include "hostgate/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <regex>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace hostgate::common {

namespace {

std::string errno_message(const std::string &what, const std::filesystem::path &path) {
  return what + ": " + path.string() + ": " + std::strerror(errno);
}

Status write_all(int fd, const std::string &content) {
  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Status::error(std::string("write failed: ") + std::strerror(errno),
                           ErrorCode::Persistence);
    }
    written += static_cast<std::size_t>(n);
  }
  return Status::success();
}

void fsync_directory(const std::filesystem::path &dir) {
  const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return;
  }
  static_cast<void>(::fsync(fd));
  static_cast<void>(::close(fd));
}

} // namespace

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> split(const std::string &value, const char delimiter) {
  std::vector<std::string> parts;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, delimiter)) {
    parts.push_back(part);
  }
  return parts;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set", ErrorCode::NotFound);
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        "Failed to create directory: " + path.string() + ": " + ec.message(),
        ErrorCode::Persistence);
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  if (value.find('$') == std::string::npos) {
    return value;
  }

  // bounded repetition keeps std::regex recursion shallow on long inputs
  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]{0,127})\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  for (auto p_it = parent.begin(); p_it != parent.end(); ++p_it) {
    if (p_it->empty()) {
      // trailing separator on the parent
      continue;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
    ++c_it;
  }

  return true;
}

Result<std::string> read_file_bytes(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Failed to open file: " + path.string(),
                                        ErrorCode::NotFound);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("I/O error while reading file: " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Result<std::filesystem::path> write_temp_sibling(const std::filesystem::path &target,
                                                 const std::string &content,
                                                 const unsigned int mode) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  const auto parent = target.parent_path();
  if (!parent.empty()) {
    if (auto ensured = ensure_dir(parent); !ensured.ok()) {
      return Result<std::filesystem::path>::failure(ensured.status());
    }
  }

  const std::filesystem::path temp =
      target.string() + ".tmp." + std::to_string(static_cast<unsigned long long>(rng()));
  const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                        static_cast<mode_t>(mode));
  if (fd < 0) {
    return Result<std::filesystem::path>::failure(
        errno_message("Failed to create temporary file", temp), ErrorCode::Persistence);
  }

  auto status = write_all(fd, content);
  if (status.ok() && ::fsync(fd) != 0) {
    status = Status::error(errno_message("fsync failed", temp), ErrorCode::Persistence);
  }
  if (::close(fd) != 0 && status.ok()) {
    status = Status::error(errno_message("close failed", temp), ErrorCode::Persistence);
  }
  if (!status.ok()) {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    return Result<std::filesystem::path>::failure(status);
  }
  return Result<std::filesystem::path>::success(temp);
}

Status commit_temp_file(const std::filesystem::path &temp, const std::filesystem::path &target) {
  if (::rename(temp.c_str(), target.c_str()) != 0) {
    const auto message = errno_message("Failed to atomically replace file", target);
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    return Status::error(message, ErrorCode::Persistence);
  }
  fsync_directory(target.parent_path());
  return Status::success();
}

Status atomic_write_file(const std::filesystem::path &target, const std::string &content,
                         const unsigned int mode) {
  auto temp = write_temp_sibling(target, content, mode);
  if (!temp.ok()) {
    return temp.status();
  }
  return commit_temp_file(temp.value(), target);
}

} // namespace hostgate::common
