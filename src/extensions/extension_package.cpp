#include "hostgate/extensions/extension.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/plugin/plugin.h"

#include <dlfcn.h>

namespace hostgate::extensions {

namespace {

struct PluginSymbols {
  hostgate_plugin_abi_version_fn abi_version = nullptr;
  hostgate_extension_info_fn info = nullptr;
  hostgate_extension_init_fn init = nullptr;
  hostgate_tool_count_fn tool_count = nullptr;
  hostgate_tool_spec_fn tool_spec = nullptr;
  hostgate_tool_execute_fn tool_execute = nullptr;
  hostgate_tool_result_free_fn tool_result_free = nullptr;
};

std::string safe_string(const char *value) { return value == nullptr ? std::string() : value; }

template <typename Fn>
common::Status resolve(void *handle, const char *symbol, Fn &out) {
  dlerror();
  void *raw = dlsym(handle, symbol);
  const char *error = dlerror();
  if (error != nullptr || raw == nullptr) {
    return common::Status::error(std::string("missing symbol ") + symbol +
                                 (error != nullptr ? std::string(": ") + error : std::string()));
  }
  out = reinterpret_cast<Fn>(raw);
  return common::Status::success();
}

int poll_cancelled(void *cancel_ctx) {
  const auto *token = static_cast<const common::CancellationToken *>(cancel_ctx);
  return token != nullptr && token->is_cancelled() ? 1 : 0;
}

/// One tool exported by a package. Holds the library open for as long as it is referenced,
/// so a reload never unmaps code under an in-flight call.
class PackageTool final : public tools::ITool {
public:
  PackageTool(std::shared_ptr<void> library, const PluginSymbols &symbols,
              const HostGateToolSpec &spec)
      : library_(std::move(library)), execute_(symbols.tool_execute),
        free_(symbols.tool_result_free), name_(safe_string(spec.name)),
        description_(safe_string(spec.description)),
        schema_(spec.parameters_json == nullptr || *spec.parameters_json == '\0'
                    ? std::string(R"({"type":"object","properties":{}})")
                    : std::string(spec.parameters_json)),
        params_(tools::params_from_schema(schema_)) {}

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view description() const override { return description_; }
  [[nodiscard]] std::vector<tools::ParamSpec> parameters() const override { return params_; }
  [[nodiscard]] std::string parameters_schema() const override { return schema_; }

  [[nodiscard]] common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override {
    const std::string args_json = tools::tool_args_to_json(args);
    HostGateToolResult *raw = execute_(name_.c_str(), args_json.c_str(), &poll_cancelled,
                                       const_cast<common::CancellationToken *>(&ctx.cancel));
    if (raw == nullptr) {
      return common::Result<tools::ToolResult>::failure("Extension tool '" + name_ +
                                                        "' returned no result");
    }

    tools::ToolResult result;
    if (raw->success != 0) {
      result = tools::ToolResult::ok(safe_string(raw->output));
    } else {
      std::string error = safe_string(raw->error);
      if (error.empty()) {
        error = safe_string(raw->output);
      }
      result = tools::ToolResult::fail(error.empty() ? "Extension tool '" + name_ + "' failed"
                                                     : std::move(error));
    }
    result.truncated = raw->truncated != 0;
    free_(raw);
    return common::Result<tools::ToolResult>::success(std::move(result));
  }

  [[nodiscard]] bool is_safe() const override { return false; }
  [[nodiscard]] std::string_view group() const override { return "extension"; }

private:
  std::shared_ptr<void> library_;
  hostgate_tool_execute_fn execute_;
  hostgate_tool_result_free_fn free_;
  std::string name_;
  std::string description_;
  std::string schema_;
  std::vector<tools::ParamSpec> params_;
};

class PackageExtension final : public IExtension {
public:
  PackageExtension(std::shared_ptr<void> library, const PluginSymbols &symbols, std::string name,
                   std::string version)
      : library_(std::move(library)), symbols_(symbols), name_(std::move(name)),
        version_(std::move(version)) {}

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view version() const override { return version_; }

  [[nodiscard]] common::Status initialize() override {
    if (const int rc = symbols_.init(); rc != 0) {
      return common::Status::error("initialization failed with code " + std::to_string(rc));
    }

    const int count = symbols_.tool_count();
    if (count < 0) {
      return common::Status::error("negative tool count " + std::to_string(count));
    }
    tools_.clear();
    for (int i = 0; i < count; ++i) {
      const HostGateToolSpec *spec = symbols_.tool_spec(i);
      if (spec == nullptr || common::trim(safe_string(spec->name)).empty()) {
        return common::Status::error("tool " + std::to_string(i) + " has no name");
      }
      tools_.push_back(std::make_shared<PackageTool>(library_, symbols_, *spec));
    }
    return common::Status::success();
  }

  [[nodiscard]] std::vector<std::shared_ptr<tools::ITool>> tools() override { return tools_; }

private:
  std::shared_ptr<void> library_;
  PluginSymbols symbols_;
  std::string name_;
  std::string version_;
  std::vector<std::shared_ptr<tools::ITool>> tools_;
};

} // namespace

std::string namespaced_tool_name(const std::string_view extension, const std::string_view tool) {
  return common::to_lower("extension_" + std::string(extension) + "_" + std::string(tool));
}

bool is_extension_package(const std::filesystem::path &path) {
  const auto ext = path.extension().string();
  return ext == ".so" || ext == ".dylib";
}

common::Result<std::shared_ptr<IExtension>>
open_extension_package(const std::filesystem::path &path) {
  using R = common::Result<std::shared_ptr<IExtension>>;

  void *raw = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (raw == nullptr) {
    const char *dl_err = dlerror();
    return R::failure(std::string("dlopen failed: ") + (dl_err != nullptr ? dl_err : "(unknown)"));
  }
  std::shared_ptr<void> library(raw, [](void *handle) { dlclose(handle); });

  PluginSymbols symbols;
  for (const auto &status : {resolve(raw, "hostgate_plugin_abi_version", symbols.abi_version),
                             resolve(raw, "hostgate_extension_info", symbols.info),
                             resolve(raw, "hostgate_extension_init", symbols.init),
                             resolve(raw, "hostgate_tool_count", symbols.tool_count),
                             resolve(raw, "hostgate_tool_spec", symbols.tool_spec),
                             resolve(raw, "hostgate_tool_execute", symbols.tool_execute),
                             resolve(raw, "hostgate_tool_result_free", symbols.tool_result_free)}) {
    if (!status.ok()) {
      return R::failure(status);
    }
  }

  if (const int abi = symbols.abi_version(); abi != HOSTGATE_PLUGIN_ABI_VERSION) {
    return R::failure("ABI version mismatch: host=" + std::to_string(HOSTGATE_PLUGIN_ABI_VERSION) +
                      " plugin=" + std::to_string(abi));
  }

  const HostGateExtensionInfo *info = symbols.info();
  std::string name = info != nullptr ? common::trim(safe_string(info->name)) : std::string();
  if (name.empty()) {
    name = path.stem().string();
    if (common::starts_with(name, "lib")) {
      name = name.substr(3);
    }
  }
  const std::string version = info != nullptr ? safe_string(info->version) : std::string();

  return R::success(std::make_shared<PackageExtension>(std::move(library), symbols,
                                                       std::move(name),
                                                       version.empty() ? "0.0.0" : version));
}

} // namespace hostgate::extensions
