#include "hostgate/tools/dispatcher.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/observability/global.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace hostgate::tools {

namespace {

using Clock = std::chrono::steady_clock;
constexpr auto kPollSlice = std::chrono::milliseconds(10);

std::string tool_key(const std::string_view name) { return common::to_lower(std::string(name)); }

/// Keeps the success/output/error/kind fields consistent whatever the handler filled in.
ToolResult normalize(ToolResult result) {
  if (result.success) {
    result.kind = common::ErrorCode::None;
    result.error.clear();
    return result;
  }
  if (result.kind == common::ErrorCode::None) {
    result.kind = common::ErrorCode::Faulted;
  }
  if (result.error.empty()) {
    result.error = result.output.empty() ? "Tool failed" : result.output;
  }
  result.output.clear();
  return result;
}

} // namespace

Dispatcher::Dispatcher() : Dispatcher(Options{}) {}

Dispatcher::Dispatcher(Options options) : options_(options) {
  if (options_.default_timeout.count() <= 0) {
    options_.default_timeout = std::chrono::milliseconds(30'000);
  }
  if (options_.max_concurrent_calls == 0) {
    options_.max_concurrent_calls = 1;
  }
}

common::Status Dispatcher::register_tool(std::shared_ptr<ITool> tool) {
  if (tool == nullptr) {
    return common::Status::error("Cannot register a null tool", common::ErrorCode::Validation);
  }
  const std::string key = tool_key(tool->name());
  if (common::trim(key).empty()) {
    return common::Status::error("Tool name must not be empty", common::ErrorCode::Validation);
  }
  if (common::starts_with(key, std::string(kExtensionToolPrefix))) {
    return common::Status::error("Tool name '" + key + "' uses the reserved prefix '" +
                                     std::string(kExtensionToolPrefix) + "'",
                                 common::ErrorCode::Validation);
  }

  std::unique_lock lock(mutex_);
  if (by_name_.contains(key)) {
    return common::Status::error("Tool already registered: " + key,
                                 common::ErrorCode::Validation);
  }
  by_name_.emplace(key, tool);
  tools_.push_back(std::move(tool));
  return common::Status::success();
}

void Dispatcher::attach_provider(std::shared_ptr<IToolProvider> provider) {
  std::unique_lock lock(mutex_);
  provider_ = std::move(provider);
}

std::shared_ptr<ITool> Dispatcher::get_tool(const std::string_view name) const {
  const std::string key = tool_key(name);
  std::shared_ptr<IToolProvider> provider;
  {
    std::shared_lock lock(mutex_);
    if (const auto it = by_name_.find(key); it != by_name_.end()) {
      return it->second;
    }
    provider = provider_;
  }
  if (provider != nullptr && common::starts_with(key, std::string(kExtensionToolPrefix))) {
    return provider->find_tool(key);
  }
  return nullptr;
}

std::vector<ToolSpec> Dispatcher::all_specs() const {
  std::vector<ToolSpec> specs;
  std::shared_ptr<IToolProvider> provider;
  {
    std::shared_lock lock(mutex_);
    specs.reserve(tools_.size());
    for (const auto &tool : tools_) {
      specs.push_back(tool->spec());
    }
    provider = provider_;
  }
  if (provider != nullptr) {
    auto extra = provider->tool_specs();
    specs.insert(specs.end(), std::make_move_iterator(extra.begin()),
                 std::make_move_iterator(extra.end()));
  }
  return specs;
}

common::Status Dispatcher::validate_arguments(const std::vector<ParamSpec> &params,
                                              const ToolArgs &args) {
  for (const auto &param : params) {
    const auto it = args.find(param.name);
    const bool present = it != args.end() && !std::holds_alternative<std::monostate>(it->second);
    if (!present) {
      if (param.required) {
        return common::Status::error("Missing required parameter: " + param.name,
                                     common::ErrorCode::Validation);
      }
      continue;
    }
    if (!value_matches(it->second, param.type)) {
      return common::Status::error("Parameter '" + param.name + "' must be " +
                                       std::string(param_type_phrase(param.type)),
                                   common::ErrorCode::Validation);
    }
  }
  return common::Status::success();
}

ToolResult Dispatcher::execute(const std::string &tool_name, const ToolArgs &args,
                               const std::optional<std::chrono::milliseconds> timeout,
                               const common::CancellationToken &cancel,
                               const std::string &call_id) const {
  const auto started = Clock::now();
  auto finish = [&](ToolResult result) {
    result = normalize(std::move(result));
    result.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    observability::record_tool_call(tool_name, result.duration, result.success,
                                    std::string(common::error_code_name(result.kind)));
    if (result.kind == common::ErrorCode::SecurityDenied) {
      observability::record_security_denial(tool_name, result.error);
    }
    return result;
  };

  const auto tool = get_tool(tool_name);
  if (tool == nullptr) {
    return finish(ToolResult::fail("Tool not found: " + tool_name, common::ErrorCode::NotFound));
  }

  if (const auto valid = validate_arguments(tool->parameters(), args); !valid.ok()) {
    return finish(ToolResult::fail(valid.error(), valid.code()));
  }

  if (cancel.is_cancelled()) {
    return finish(
        ToolResult::fail("Tool call cancelled: " + tool_name, common::ErrorCode::Cancelled));
  }

  auto effective = timeout.value_or(options_.default_timeout);
  if (effective.count() <= 0) {
    effective = options_.default_timeout;
  }
  return finish(run(tool, args, effective, cancel, call_id));
}

ToolResult Dispatcher::run(const std::shared_ptr<ITool> &tool, const ToolArgs &args,
                           const std::chrono::milliseconds timeout,
                           const common::CancellationToken &cancel,
                           const std::string &call_id) const {
  common::CancellationSource internal;
  ToolContext ctx{.call_id = call_id, .cancel = internal.token()};

  // The worker owns everything it touches, so abandoning it on timeout is safe.
  auto promise = std::make_shared<std::promise<common::Result<ToolResult>>>();
  auto future = promise->get_future();
  std::thread([tool, args, ctx, promise]() {
    try {
      promise->set_value(tool->execute(args, ctx));
    } catch (const std::exception &e) {
      promise->set_value(common::Result<ToolResult>::failure(
          "Tool '" + std::string(tool->name()) + "' threw: " + e.what()));
    } catch (...) {
      promise->set_value(common::Result<ToolResult>::failure(
          "Tool '" + std::string(tool->name()) + "' threw a non-standard exception"));
    }
  }).detach();

  const auto deadline = Clock::now() + timeout;
  const std::string name(tool->name());
  while (future.wait_for(kPollSlice) != std::future_status::ready) {
    if (cancel.is_cancelled()) {
      internal.cancel();
      return ToolResult::fail("Tool call cancelled: " + name, common::ErrorCode::Cancelled);
    }
    if (Clock::now() >= deadline) {
      internal.cancel();
      return ToolResult::fail("Tool '" + name + "' timed out after " +
                                  std::to_string(timeout.count()) + " ms",
                              common::ErrorCode::Timeout);
    }
  }

  auto outcome = future.get();
  if (!outcome.ok()) {
    return ToolResult::fail(outcome.error(), outcome.code());
  }
  return outcome.value();
}

std::future<ToolResult> Dispatcher::execute_async(std::string tool_name, ToolArgs args,
                                                  std::optional<std::chrono::milliseconds> timeout,
                                                  common::CancellationToken cancel) const {
  return std::async(std::launch::async,
                    [this, tool_name = std::move(tool_name), args = std::move(args), timeout,
                     cancel = std::move(cancel)]() {
                      return execute(tool_name, args, timeout, cancel);
                    });
}

std::vector<ToolCallResult> Dispatcher::execute_batch(const std::vector<ToolCallRequest> &calls,
                                                      const common::CancellationToken &cancel) const {
  std::vector<ToolCallResult> results(calls.size());
  std::atomic<std::size_t> next{0};

  auto worker = [&]() {
    for (std::size_t i = next.fetch_add(1); i < calls.size(); i = next.fetch_add(1)) {
      const auto &call = calls[i];
      results[i].id = call.id;
      results[i].tool = call.tool;
      results[i].result = execute(call.tool, call.arguments, call.timeout, cancel, call.id);
    }
  };

  const std::size_t workers = std::min(calls.size(), options_.max_concurrent_calls);
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    futures.push_back(std::async(std::launch::async, worker));
  }
  for (auto &future : futures) {
    future.get();
  }
  return results;
}

} // namespace hostgate::tools
