#pragma once

#include <cstdint>
#include <string>

namespace hostgate::config {

struct GatewayConfig {
  std::uint64_t default_timeout_ms = 30'000;
  std::uint32_t max_concurrent_calls = 8;
};

struct ExtensionsConfig {
  std::string dir = "~/.hostgate/extensions";
  bool enabled = true;
};

struct SecretsConfig {
  std::string path = "~/.hostgate/secure_storage.dat";
  std::string key_path = "~/.hostgate/secrets.key";
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  GatewayConfig gateway;
  ExtensionsConfig extensions;
  SecretsConfig secrets;
  ObservabilityConfig observability;
};

} // namespace hostgate::config
