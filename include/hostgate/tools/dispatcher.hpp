#pragma once

#include "hostgate/tools/tool.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostgate::tools {

/// Reserved for tools contributed by extensions.
inline constexpr std::string_view kExtensionToolPrefix = "extension_";

struct ToolCallRequest {
  std::string id;
  std::string tool;
  ToolArgs arguments;
  std::optional<std::chrono::milliseconds> timeout;
};

struct ToolCallResult {
  std::string id;
  std::string tool;
  ToolResult result;
};

/// A dynamic source of tools consulted on every lookup, after the built-ins.
class IToolProvider {
public:
  virtual ~IToolProvider() = default;

  [[nodiscard]] virtual std::shared_ptr<ITool> find_tool(std::string_view name) const = 0;
  [[nodiscard]] virtual std::vector<ToolSpec> tool_specs() const = 0;
};

class Dispatcher {
public:
  struct Options {
    std::chrono::milliseconds default_timeout{30'000};
    std::size_t max_concurrent_calls = 8;
  };

  Dispatcher();
  explicit Dispatcher(Options options);

  /// Rejects duplicate names and the reserved extension prefix.
  [[nodiscard]] common::Status register_tool(std::shared_ptr<ITool> tool);
  void attach_provider(std::shared_ptr<IToolProvider> provider);

  [[nodiscard]] std::shared_ptr<ITool> get_tool(std::string_view name) const;
  /// Built-ins in registration order, then provider tools.
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;

  /// Looks up, validates and runs one call on a worker thread. Never throws.
  [[nodiscard]] ToolResult execute(const std::string &tool_name, const ToolArgs &args,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                   const common::CancellationToken &cancel = {},
                                   const std::string &call_id = "") const;
  [[nodiscard]] std::future<ToolResult>
  execute_async(std::string tool_name, ToolArgs args,
                std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                common::CancellationToken cancel = {}) const;
  /// Independent calls run concurrently, at most max_concurrent_calls at a time. Results keep
  /// the request order.
  [[nodiscard]] std::vector<ToolCallResult>
  execute_batch(const std::vector<ToolCallRequest> &calls,
                const common::CancellationToken &cancel = {}) const;

  [[nodiscard]] static common::Status validate_arguments(const std::vector<ParamSpec> &params,
                                                         const ToolArgs &args);

  [[nodiscard]] const Options &options() const { return options_; }

private:
  [[nodiscard]] ToolResult run(const std::shared_ptr<ITool> &tool, const ToolArgs &args,
                               std::chrono::milliseconds timeout,
                               const common::CancellationToken &cancel,
                               const std::string &call_id) const;

  Options options_;
  mutable std::shared_mutex mutex_;
  std::vector<std::shared_ptr<ITool>> tools_;
  std::unordered_map<std::string, std::shared_ptr<ITool>> by_name_;
  std::shared_ptr<IToolProvider> provider_;
};

} // namespace hostgate::tools
