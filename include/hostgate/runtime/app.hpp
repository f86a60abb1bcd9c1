#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/config/schema.hpp"
#include "hostgate/extensions/extension_registry.hpp"
#include "hostgate/process/process_manager.hpp"
#include "hostgate/security/credential_store.hpp"
#include "hostgate/tools/dispatcher.hpp"

#include <memory>

namespace hostgate::runtime {

/// Everything a request needs, wired in startup order: built-ins first, then extensions.
struct Gateway {
  std::shared_ptr<process::ProcessManager> processes;
  /// Null when extensions are disabled in config.
  std::shared_ptr<extensions::ExtensionRegistry> extensions;
  std::shared_ptr<tools::Dispatcher> dispatcher;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;

  /// Installs the configured observer as the process-wide logging channel.
  void install_observer() const;

  [[nodiscard]] common::Result<Gateway> create_gateway() const;
  [[nodiscard]] common::Result<std::shared_ptr<security::CredentialStore>>
  create_credential_store() const;

private:
  config::Config config_;
};

} // namespace hostgate::runtime
