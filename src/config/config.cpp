#include "hostgate/config/config.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace hostgate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".hostgate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("HOSTGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool is_known_level(const std::string &level) {
  const std::string normalized = common::to_lower(common::trim(level));
  return normalized == "debug" || normalized == "info" || normalized == "warn" ||
         normalized == "error";
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }

    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory", common::ErrorCode::NotFound);
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  if (const char *dir = non_empty_env("HOSTGATE_EXTENSIONS_DIR"); dir != nullptr) {
    config.extensions.dir = dir;
  }
  if (const char *path = non_empty_env("HOSTGATE_SECRETS_PATH"); path != nullptr) {
    config.secrets.path = path;
  }
  if (const char *level = non_empty_env("HOSTGATE_LOG_LEVEL"); level != nullptr) {
    config.observability.level = common::to_lower(level);
  }
  if (const char *timeout = non_empty_env("HOSTGATE_DEFAULT_TIMEOUT_MS"); timeout != nullptr) {
    const std::string raw = common::trim(timeout);
    std::uint64_t parsed = 0;
    const auto *first = raw.data();
    const auto *last = first + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last) {
      config.gateway.default_timeout_ms = parsed;
    }
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }

  const auto &doc = parsed.value();
  Config config;

  const auto timeout =
      doc.get_int("gateway.default_timeout_ms",
                  static_cast<std::int64_t>(config.gateway.default_timeout_ms));
  config.gateway.default_timeout_ms = timeout > 0 ? static_cast<std::uint64_t>(timeout) : 0;
  const auto max_calls = doc.get_int("gateway.max_concurrent_calls",
                                     static_cast<std::int64_t>(config.gateway.max_concurrent_calls));
  config.gateway.max_concurrent_calls = max_calls > 0 ? static_cast<std::uint32_t>(max_calls) : 0;

  config.extensions.dir = doc.get_string("extensions.dir", config.extensions.dir);
  config.extensions.enabled = doc.get_bool("extensions.enabled", config.extensions.enabled);

  config.secrets.path = doc.get_string("secrets.path", config.secrets.path);
  config.secrets.key_path = doc.get_string("secrets.key_path", config.secrets.key_path);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file_bytes(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           content.code());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error(), config.code());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  std::ostringstream file;
  file << "[gateway]\n";
  file << "default_timeout_ms = " << config.gateway.default_timeout_ms << "\n";
  file << "max_concurrent_calls = " << config.gateway.max_concurrent_calls << "\n";

  file << "\n[extensions]\n";
  file << "dir = " << common::quote_toml_string(config.extensions.dir) << "\n";
  file << "enabled = " << bool_to_toml(config.extensions.enabled) << "\n";

  file << "\n[secrets]\n";
  file << "path = " << common::quote_toml_string(config.secrets.path) << "\n";
  file << "key_path = " << common::quote_toml_string(config.secrets.key_path) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "level = " << common::quote_toml_string(config.observability.level) << "\n";

  return common::atomic_write_file(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.gateway.default_timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "gateway.default_timeout_ms must be positive", common::ErrorCode::Validation);
  }
  if (config.gateway.max_concurrent_calls == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "gateway.max_concurrent_calls must be positive", common::ErrorCode::Validation);
  }

  if (!is_known_level(config.observability.level)) {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid observability.level: " + config.observability.level,
        common::ErrorCode::Validation);
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none" && backend != "noop") {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  if (common::trim(config.secrets.path).empty()) {
    return common::Result<std::vector<std::string>>::failure("secrets.path must not be empty",
                                                              common::ErrorCode::Validation);
  }

  if (config.extensions.enabled && common::trim(config.extensions.dir).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "extensions.dir must be set when extensions are enabled", common::ErrorCode::Validation);
  }

  if (config.gateway.default_timeout_ms > 10ULL * 60ULL * 1000ULL) {
    warnings.push_back("gateway.default_timeout_ms exceeds 10 minutes");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace hostgate::config
