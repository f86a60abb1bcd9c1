#include "hostgate/extensions/extension_registry.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/observability/global.hpp"

#include <algorithm>
#include <exception>
#include <mutex>

namespace hostgate::extensions {

namespace {

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/// Presents an extension tool under its namespaced name and stamps last-used on each call.
class NamespacedTool final : public tools::ITool {
public:
  NamespacedTool(std::string name, std::shared_ptr<tools::ITool> inner,
                 std::shared_ptr<std::atomic<std::int64_t>> last_used)
      : name_(std::move(name)), inner_(std::move(inner)), last_used_(std::move(last_used)) {}

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view description() const override { return inner_->description(); }
  [[nodiscard]] std::vector<tools::ParamSpec> parameters() const override {
    return inner_->parameters();
  }
  [[nodiscard]] std::string parameters_schema() const override {
    return inner_->parameters_schema();
  }

  [[nodiscard]] common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override {
    last_used_->store(now_ms(), std::memory_order_relaxed);
    return inner_->execute(args, ctx);
  }

  [[nodiscard]] bool is_safe() const override { return inner_->is_safe(); }
  [[nodiscard]] std::string_view group() const override { return "extension"; }

private:
  std::string name_;
  std::shared_ptr<tools::ITool> inner_;
  std::shared_ptr<std::atomic<std::int64_t>> last_used_;
};

bool same_name(const std::string_view a, const std::string_view b) {
  return common::to_lower(std::string(a)) == common::to_lower(std::string(b));
}

} // namespace

ExtensionRegistry::ExtensionRegistry(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

common::Result<ExtensionRegistry::Entry>
ExtensionRegistry::make_entry(std::shared_ptr<IExtension> extension,
                              std::filesystem::path origin) const {
  using R = common::Result<Entry>;
  if (extension == nullptr) {
    return R::failure("null extension", common::ErrorCode::Validation);
  }
  const std::string name(extension->name());
  if (common::trim(name).empty()) {
    return R::failure("extension has no name", common::ErrorCode::Validation);
  }

  try {
    if (auto init = extension->initialize(); !init.ok()) {
      return R::failure("extension '" + name + "': " + init.error(), init.code());
    }
  } catch (const std::exception &e) {
    return R::failure("extension '" + name + "' threw during initialization: " + e.what());
  }

  Entry entry;
  entry.last_used = std::make_shared<std::atomic<std::int64_t>>(0);
  entry.descriptor.name = name;
  entry.descriptor.version = std::string(extension->version());
  entry.descriptor.origin = std::move(origin);
  entry.descriptor.enabled = true;
  entry.descriptor.installed_at = std::chrono::system_clock::now();

  for (auto &tool : extension->tools()) {
    if (tool == nullptr) {
      continue;
    }
    std::string full = namespaced_tool_name(name, tool->name());
    const bool duplicate = std::find(entry.descriptor.tools.begin(), entry.descriptor.tools.end(),
                                     full) != entry.descriptor.tools.end();
    if (duplicate) {
      return R::failure("extension '" + name + "' declares tool '" + std::string(tool->name()) +
                            "' twice",
                        common::ErrorCode::Validation);
    }
    entry.descriptor.tools.push_back(full);
    entry.tools.push_back(
        std::make_shared<NamespacedTool>(std::move(full), std::move(tool), entry.last_used));
  }
  entry.extension = std::move(extension);
  return R::success(std::move(entry));
}

std::vector<ExtensionRegistry::Entry>::const_iterator
ExtensionRegistry::find_entry(const std::string_view name) const {
  return std::find_if(entries_.begin(), entries_.end(),
                      [name](const Entry &e) { return same_name(e.descriptor.name, name); });
}

std::optional<std::string> ExtensionRegistry::admission_error(const Entry &entry) const {
  if (find_entry(entry.descriptor.name) != entries_.end()) {
    return "extension name '" + entry.descriptor.name + "' is already loaded";
  }
  // `a_b` + `c` and `a` + `b_c` namespace to the same name; the first one loaded keeps it
  for (const auto &other : entries_) {
    for (const auto &tool : entry.descriptor.tools) {
      const auto &taken = other.descriptor.tools;
      if (std::find(taken.begin(), taken.end(), tool) != taken.end()) {
        return "tool '" + tool + "' is already provided by extension '" + other.descriptor.name +
               "'";
      }
    }
  }
  return std::nullopt;
}

LoadSummary ExtensionRegistry::load() {
  LoadSummary summary;

  auto dir = common::ensure_dir(directory_);
  if (!dir.ok()) {
    observability::record_error("extensions", dir.error());
    summary.errors.push_back(dir.error());
    return summary;
  }

  std::vector<std::filesystem::path> packages;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && is_extension_package(it->path())) {
      packages.push_back(it->path());
    }
  }
  if (ec) {
    observability::record_error("extensions", "Failed to scan " + directory_.string() + ": " +
                                                  ec.message());
  }
  std::sort(packages.begin(), packages.end());

  for (const auto &package : packages) {
    {
      std::shared_lock lock(mutex_);
      const bool already = std::any_of(entries_.begin(), entries_.end(), [&](const Entry &e) {
        return e.descriptor.origin == package;
      });
      if (already) {
        continue;
      }
    }

    auto failed = [&](const std::string &reason) {
      const std::string line = package.filename().string() + ": " + reason;
      observability::record_extension(package.filename().string(), "failed", reason);
      summary.errors.push_back(line);
      ++summary.failed;
    };

    auto opened = open_extension_package(package);
    if (!opened.ok()) {
      failed(opened.error());
      continue;
    }
    auto entry = make_entry(opened.value(), package);
    if (!entry.ok()) {
      failed(entry.error());
      continue;
    }

    std::unique_lock lock(mutex_);
    if (auto rejected = admission_error(entry.value()); rejected.has_value()) {
      lock.unlock();
      failed(*rejected);
      continue;
    }
    observability::record_extension(entry.value().descriptor.name, "loaded",
                                    package.filename().string());
    entries_.push_back(std::move(entry.value()));
    ++summary.loaded;
  }

  publish_count();
  return summary;
}

bool ExtensionRegistry::register_extension(std::shared_ptr<IExtension> extension) {
  if (extension == nullptr) {
    return false;
  }
  {
    std::shared_lock lock(mutex_);
    if (find_entry(extension->name()) != entries_.end()) {
      return false;
    }
  }

  auto entry = make_entry(std::move(extension), {});
  if (!entry.ok()) {
    observability::record_error("extensions", entry.error());
    return false;
  }

  {
    std::unique_lock lock(mutex_);
    if (auto rejected = admission_error(entry.value()); rejected.has_value()) {
      lock.unlock();
      observability::record_extension(entry.value().descriptor.name, "failed", *rejected);
      return false;
    }
    observability::record_extension(entry.value().descriptor.name, "registered");
    entries_.push_back(std::move(entry.value()));
  }
  publish_count();
  return true;
}

bool ExtensionRegistry::unregister(const std::string_view name) {
  {
    std::unique_lock lock(mutex_);
    const auto it = find_entry(name);
    if (it == entries_.end()) {
      return false;
    }
    observability::record_extension(it->descriptor.name, "unregistered");
    entries_.erase(it);
  }
  publish_count();
  return true;
}

LoadSummary ExtensionRegistry::reload() {
  {
    std::unique_lock lock(mutex_);
    // tool wrappers still held by in-flight calls keep their library mapped
    entries_.clear();
  }
  observability::record_extension("*", "reloaded", directory_.string());
  return load();
}

ExtensionDescriptor ExtensionRegistry::snapshot(const Entry &entry) const {
  ExtensionDescriptor descriptor = entry.descriptor;
  if (const auto stamp = entry.last_used->load(std::memory_order_relaxed); stamp > 0) {
    descriptor.last_used =
        std::chrono::system_clock::time_point(std::chrono::milliseconds(stamp));
  }
  return descriptor;
}

std::vector<ExtensionDescriptor> ExtensionRegistry::get_loaded() const {
  std::shared_lock lock(mutex_);
  std::vector<ExtensionDescriptor> out;
  out.reserve(entries_.size());
  for (const auto &entry : entries_) {
    out.push_back(snapshot(entry));
  }
  return out;
}

bool ExtensionRegistry::set_enabled(const std::string_view name, const bool enabled) {
  std::unique_lock lock(mutex_);
  const auto it = find_entry(name);
  if (it == entries_.end()) {
    return false;
  }
  auto &entry = entries_[static_cast<std::size_t>(it - entries_.begin())];
  entry.descriptor.enabled = enabled;
  observability::record_extension(entry.descriptor.name, enabled ? "enabled" : "disabled");
  return true;
}

std::shared_ptr<tools::ITool> ExtensionRegistry::find_tool(const std::string_view name) const {
  const std::string key = common::to_lower(std::string(name));
  std::shared_lock lock(mutex_);
  for (const auto &entry : entries_) {
    if (!entry.descriptor.enabled) {
      continue;
    }
    for (const auto &tool : entry.tools) {
      if (tool->name() == key) {
        return tool;
      }
    }
  }
  return nullptr;
}

std::vector<tools::ToolSpec> ExtensionRegistry::tool_specs() const {
  std::shared_lock lock(mutex_);
  std::vector<tools::ToolSpec> specs;
  for (const auto &entry : entries_) {
    if (!entry.descriptor.enabled) {
      continue;
    }
    for (const auto &tool : entry.tools) {
      specs.push_back(tool->spec());
    }
  }
  return specs;
}

void ExtensionRegistry::publish_count() const {
  std::size_t count = 0;
  {
    std::shared_lock lock(mutex_);
    count = entries_.size();
  }
  observability::record_metric(
      observability::LoadedExtensionsMetric{static_cast<std::uint64_t>(count)});
}

} // namespace hostgate::extensions
