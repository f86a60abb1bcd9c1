#include "test_framework.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(const std::filesystem::path &path) {
    hostgate::config::set_config_path_override(path);
  }
  ~ConfigOverrideGuard() { hostgate::config::set_config_path_override(std::nullopt); }

  ConfigOverrideGuard(const ConfigOverrideGuard &) = delete;
  ConfigOverrideGuard &operator=(const ConfigOverrideGuard &) = delete;
};

} // namespace

void register_config_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;
  namespace config = hostgate::config;
  using hostgate::testing::EnvGuard;
  using hostgate::testing::TempWorkspace;

  tests.push_back({"config_defaults", [] {
                     const config::Config cfg;
                     require(cfg.gateway.default_timeout_ms == 30000, "default timeout");
                     require(cfg.gateway.max_concurrent_calls == 8, "default concurrency");
                     require(cfg.extensions.enabled, "extensions enabled by default");
                     require(cfg.extensions.dir == "~/.hostgate/extensions", "default dir");
                     require(cfg.observability.level == "info", "default level");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     const auto parsed = config::parse_config(
                         "[gateway]\ndefault_timeout_ms = 5000\nmax_concurrent_calls = 2\n"
                         "[extensions]\ndir = \"/srv/ext\"\nenabled = false\n"
                         "[observability]\nbackend = \"none\"\nlevel = \"DEBUG\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &cfg = parsed.value();
                     require(cfg.gateway.default_timeout_ms == 5000, "timeout parsed");
                     require(cfg.gateway.max_concurrent_calls == 2, "concurrency parsed");
                     require(cfg.extensions.dir == "/srv/ext", "dir parsed");
                     require(!cfg.extensions.enabled, "enabled parsed");
                     require(cfg.observability.backend == "none", "backend parsed");
                     require(cfg.observability.level == "debug", "level lower-cased");
                   }});

  tests.push_back({"config_parse_rejects_garbage", [] {
                     const auto parsed = config::parse_config("[gateway]\nthis is not toml\n");
                     require(!parsed.ok(), "line without '=' must fail");
                   }});

  tests.push_back({"config_validate_hard_errors", [] {
                     config::Config cfg;
                     cfg.gateway.default_timeout_ms = 0;
                     require(!config::validate_config(cfg).ok(), "zero timeout rejected");

                     cfg = config::Config{};
                     cfg.observability.level = "verbose";
                     const auto bad_level = config::validate_config(cfg);
                     require(!bad_level.ok() &&
                                 bad_level.error().find("observability.level") != std::string::npos,
                             "unknown level rejected");

                     cfg = config::Config{};
                     cfg.extensions.dir = "  ";
                     require(!config::validate_config(cfg).ok(), "blank extension dir rejected");
                     cfg.extensions.enabled = false;
                     require(config::validate_config(cfg).ok(),
                             "blank dir is fine when extensions are off");
                   }});

  tests.push_back({"config_validate_warnings", [] {
                     config::Config cfg;
                     cfg.observability.backend = "prometheus";
                     cfg.gateway.default_timeout_ms = 11ULL * 60ULL * 1000ULL;
                     const auto result = config::validate_config(cfg);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "two warnings expected");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     EnvGuard dir("HOSTGATE_EXTENSIONS_DIR", std::string("/env/ext"));
                     EnvGuard level("HOSTGATE_LOG_LEVEL", std::string("WARN"));
                     EnvGuard timeout("HOSTGATE_DEFAULT_TIMEOUT_MS", std::string("1234"));
                     EnvGuard secrets("HOSTGATE_SECRETS_PATH", std::nullopt);
                     config::Config cfg;
                     config::apply_env_overrides(cfg);
                     require(cfg.extensions.dir == "/env/ext", "dir override");
                     require(cfg.observability.level == "warn", "level override");
                     require(cfg.gateway.default_timeout_ms == 1234, "timeout override");
                     require(cfg.secrets.path == "~/.hostgate/secure_storage.dat",
                             "unset variable leaves default");
                   }});

  tests.push_back({"config_env_timeout_ignores_junk", [] {
                     EnvGuard timeout("HOSTGATE_DEFAULT_TIMEOUT_MS", std::string("12s"));
                     config::Config cfg;
                     config::apply_env_overrides(cfg);
                     require(cfg.gateway.default_timeout_ms == 30000, "junk value ignored");
                   }});

  tests.push_back({"config_save_load_roundtrip", [] {
                     TempWorkspace ws;
                     const auto file = ws.path() / "cfg" / "config.toml";
                     ConfigOverrideGuard guard(file);
                     EnvGuard dir("HOSTGATE_EXTENSIONS_DIR", std::nullopt);
                     EnvGuard level("HOSTGATE_LOG_LEVEL", std::nullopt);
                     EnvGuard timeout("HOSTGATE_DEFAULT_TIMEOUT_MS", std::nullopt);
                     EnvGuard secrets("HOSTGATE_SECRETS_PATH", std::nullopt);

                     const auto path = config::config_path();
                     require(path.ok() && path.value() == file, "override path honoured");

                     config::Config cfg;
                     cfg.gateway.default_timeout_ms = 4500;
                     cfg.extensions.dir = "/tmp/with \"quotes\"";
                     cfg.observability.backend = "none";
                     require(config::save_config(cfg).ok(), "save");

                     const auto loaded = config::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().gateway.default_timeout_ms == 4500, "timeout kept");
                     require(loaded.value().extensions.dir == cfg.extensions.dir,
                             "quoted string kept");
                     require(loaded.value().observability.backend == "none", "backend kept");
                   }});

  tests.push_back({"config_missing_file_gives_defaults", [] {
                     TempWorkspace ws;
                     ConfigOverrideGuard guard(ws.path() / "absent.toml");
                     EnvGuard timeout("HOSTGATE_DEFAULT_TIMEOUT_MS", std::nullopt);
                     const auto loaded = config::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().gateway.default_timeout_ms == 30000, "defaults");
                   }});
}
