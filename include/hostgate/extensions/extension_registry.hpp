#pragma once

#include "hostgate/extensions/extension.hpp"
#include "hostgate/tools/dispatcher.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace hostgate::extensions {

struct LoadSummary {
  std::size_t loaded = 0;
  std::size_t failed = 0;
  /// One line per package that was skipped.
  std::vector<std::string> errors;
};

/// Owns the loaded extensions and exposes their enabled tools to a Dispatcher.
/// Package failures are logged and skipped, never propagated.
class ExtensionRegistry final : public tools::IToolProvider {
public:
  explicit ExtensionRegistry(std::filesystem::path directory);

  /// Creates the directory if needed and loads every package not already loaded.
  LoadSummary load();
  /// Adds an in-process provider. False when the name or one of its namespaced tool names is
  /// taken, or initialization fails.
  bool register_extension(std::shared_ptr<IExtension> extension);
  /// False when no extension has that name.
  bool unregister(std::string_view name);
  /// Drops every loaded extension, then loads the directory again.
  LoadSummary reload();

  [[nodiscard]] std::vector<ExtensionDescriptor> get_loaded() const;
  /// False when no extension has that name.
  bool set_enabled(std::string_view name, bool enabled);

  [[nodiscard]] std::shared_ptr<tools::ITool> find_tool(std::string_view name) const override;
  [[nodiscard]] std::vector<tools::ToolSpec> tool_specs() const override;

  [[nodiscard]] const std::filesystem::path &directory() const { return directory_; }

private:
  struct Entry {
    ExtensionDescriptor descriptor;
    std::shared_ptr<IExtension> extension;
    std::vector<std::shared_ptr<tools::ITool>> tools;
    /// Milliseconds since the epoch, 0 until first use. Shared with the tool wrappers.
    std::shared_ptr<std::atomic<std::int64_t>> last_used;
  };

  [[nodiscard]] common::Result<Entry> make_entry(std::shared_ptr<IExtension> extension,
                                                 std::filesystem::path origin) const;
  [[nodiscard]] ExtensionDescriptor snapshot(const Entry &entry) const;
  [[nodiscard]] std::vector<Entry>::const_iterator find_entry(std::string_view name) const;
  /// Why `entry` cannot join the loaded set, if it cannot. Caller holds the lock.
  [[nodiscard]] std::optional<std::string> admission_error(const Entry &entry) const;
  void publish_count() const;

  std::filesystem::path directory_;
  mutable std::shared_mutex mutex_;
  std::vector<Entry> entries_;
};

} // namespace hostgate::extensions
