#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/tools/tool.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostgate::extensions {

struct ExtensionDescriptor {
  std::string name;
  std::string version;
  /// Empty for providers registered in-process.
  std::filesystem::path origin;
  bool enabled = true;
  std::chrono::system_clock::time_point installed_at;
  std::optional<std::chrono::system_clock::time_point> last_used;
  /// Namespaced names, as the dispatcher exposes them.
  std::vector<std::string> tools;
};

/// A provider of tools. Shared-library packages are adapted to this interface on load;
/// statically linked providers implement it directly.
class IExtension {
public:
  virtual ~IExtension() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view version() const = 0;
  /// Called once before any tool is listed or executed.
  [[nodiscard]] virtual common::Status initialize() = 0;
  /// Tools under their own (un-namespaced) names.
  [[nodiscard]] virtual std::vector<std::shared_ptr<tools::ITool>> tools() = 0;
};

/// `extension_<extension>_<tool>`, lower-cased.
[[nodiscard]] std::string namespaced_tool_name(std::string_view extension, std::string_view tool);

/// Opens a package, resolves the plugin ABI and checks its version. Does not initialize.
[[nodiscard]] common::Result<std::shared_ptr<IExtension>>
open_extension_package(const std::filesystem::path &path);

/// `.so` and `.dylib` files.
[[nodiscard]] bool is_extension_package(const std::filesystem::path &path);

} // namespace hostgate::extensions
