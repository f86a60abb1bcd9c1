#include "hostgate/runtime/app.hpp"

#include "hostgate/config/config.hpp"
#include "hostgate/observability/factory.hpp"
#include "hostgate/observability/global.hpp"
#include "hostgate/tools/builtin/builtin.hpp"

namespace hostgate::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.status());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure(validated.status());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
  if (auto warnings = config::validate_config(config_); warnings.ok()) {
    for (const auto &warning : warnings.value()) {
      observability::record_error("config", warning);
    }
  }
}

common::Result<Gateway> RuntimeContext::create_gateway() const {
  Gateway gateway;
  gateway.processes = std::make_shared<process::ProcessManager>();

  tools::Dispatcher::Options options;
  options.default_timeout = std::chrono::milliseconds(config_.gateway.default_timeout_ms);
  options.max_concurrent_calls = config_.gateway.max_concurrent_calls;
  gateway.dispatcher = std::make_shared<tools::Dispatcher>(options);

  if (auto registered = tools::register_builtin_tools(*gateway.dispatcher, gateway.processes);
      !registered.ok()) {
    return common::Result<Gateway>::failure(registered);
  }

  if (config_.extensions.enabled) {
    gateway.extensions = std::make_shared<extensions::ExtensionRegistry>(
        config::expand_config_path(config_.extensions.dir));
    const auto summary = gateway.extensions->load();
    observability::record_extension("*", "loaded",
                                    std::to_string(summary.loaded) + " loaded, " +
                                        std::to_string(summary.failed) + " failed");
    gateway.dispatcher->attach_provider(gateway.extensions);
  }

  return common::Result<Gateway>::success(std::move(gateway));
}

common::Result<std::shared_ptr<security::CredentialStore>>
RuntimeContext::create_credential_store() const {
  security::CredentialStoreOptions options;
  options.path = config::expand_config_path(config_.secrets.path);
  options.protector = std::make_shared<security::KeyFileProtector>(
      config::expand_config_path(config_.secrets.key_path));
  return common::Result<std::shared_ptr<security::CredentialStore>>::success(
      std::make_shared<security::CredentialStore>(std::move(options)));
}

} // namespace hostgate::runtime
