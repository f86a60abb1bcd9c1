#include "test_framework.hpp"

#include "hostgate/extensions/extension_registry.hpp"
#include "hostgate/runtime/app.hpp"
#include "hostgate/tools/dispatcher.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <thread>

#ifndef HOSTGATE_TEST_PLUGIN_PATH
#error "HOSTGATE_TEST_PLUGIN_PATH must name the echo extension built alongside the tests"
#endif
#ifndef HOSTGATE_FAILING_PLUGIN_PATH
#error "HOSTGATE_FAILING_PLUGIN_PATH must name the failing extension built alongside the tests"
#endif

namespace {

namespace common = hostgate::common;
namespace extensions = hostgate::extensions;
namespace tools = hostgate::tools;
using hostgate::testing::TempWorkspace;

std::filesystem::path install_package(const TempWorkspace &ws, const char *source,
                                      const std::string &as) {
  const auto dir = ws.path() / "extensions";
  std::filesystem::create_directories(dir);
  const auto target = dir / as;
  std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing);
  return target;
}

class StaticTool final : public tools::ITool {
public:
  explicit StaticTool(std::string name) : name_(std::move(name)) {}

  std::string_view name() const override { return name_; }
  std::string_view description() const override { return "Reply with pong"; }
  std::vector<tools::ParamSpec> parameters() const override { return {}; }
  common::Result<tools::ToolResult> execute(const tools::ToolArgs &,
                                            const tools::ToolContext &) override {
    return common::Result<tools::ToolResult>::success(tools::ToolResult::ok("pong"));
  }
  bool is_safe() const override { return true; }
  std::string_view group() const override { return "static"; }

private:
  std::string name_;
};

class StaticExtension final : public extensions::IExtension {
public:
  explicit StaticExtension(std::string name, bool fail_init = false, std::string tool = "Ping")
      : name_(std::move(name)), fail_init_(fail_init), tool_(std::move(tool)) {}

  std::string_view name() const override { return name_; }
  std::string_view version() const override { return "0.1.0"; }
  common::Status initialize() override {
    return fail_init_ ? common::Status::error("not today") : common::Status::success();
  }
  std::vector<std::shared_ptr<tools::ITool>> tools() override {
    return {std::make_shared<StaticTool>(tool_)};
  }

private:
  std::string name_;
  bool fail_init_;
  std::string tool_;
};

} // namespace

void register_extensions_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;

  tests.push_back({"extension_names_are_namespaced", [] {
                     require(extensions::namespaced_tool_name("Echo", "Say") == "extension_echo_say",
                             "lower-cased namespaced name");
                     require(extensions::is_extension_package("x/libfoo.so"), ".so");
                     require(extensions::is_extension_package("foo.dylib"), ".dylib");
                     require(!extensions::is_extension_package("foo.txt"), "other files");
                   }});

  tests.push_back({"extension_package_loads_and_runs", [] {
                     TempWorkspace ws;
                     install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo.so");
                     auto registry = std::make_shared<extensions::ExtensionRegistry>(ws.path() / "extensions");
                     const auto summary = registry->load();
                     require(summary.loaded == 1 && summary.failed == 0, "one package loaded");

                     const auto loaded = registry->get_loaded();
                     require(loaded.size() == 1, "one descriptor");
                     require(loaded[0].name == "echo" && loaded[0].version == "1.2.0", "metadata");
                     require(loaded[0].tools ==
                                 std::vector<std::string>{"extension_echo_say", "extension_echo_wait"},
                             "namespaced tools");
                     require(!loaded[0].last_used.has_value(), "unused so far");

                     tools::Dispatcher dispatcher;
                     dispatcher.attach_provider(registry);
                     const auto result = dispatcher.execute("extension_echo_say",
                                                            {{"text", std::string("hello")}});
                     require(result.success, result.error);
                     require(result.output == "echo: hello", result.output);
                     require(registry->get_loaded()[0].last_used.has_value(), "last_used stamped");

                     const auto missing = dispatcher.execute("extension_echo_say", {});
                     require(missing.error == "Missing required parameter: text",
                             "schema drives validation");
                     require(dispatcher.execute("echo_say", {}).kind == common::ErrorCode::NotFound,
                             "un-namespaced name not exposed");
                   }});

  tests.push_back({"extension_failures_are_isolated", [] {
                     TempWorkspace ws;
                     hostgate::testing::ObserverCapture capture;
                     install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo.so");
                     install_package(ws, HOSTGATE_FAILING_PLUGIN_PATH, "failing.so");
                     ws.create_file("extensions/broken.so", "not a shared library");
                     ws.create_file("extensions/readme.txt", "ignored");

                     extensions::ExtensionRegistry registry(ws.path() / "extensions");
                     const auto summary = registry.load();
                     require(summary.loaded == 1, "echo still loads");
                     require(summary.failed == 2, "two packages skipped");
                     require(summary.errors.size() == 2, "one error line each");
                     require(registry.get_loaded().size() == 1, "only echo registered");

                     std::size_t failures = 0;
                     for (const auto &event :
                          capture.observer().events_of<hostgate::observability::ExtensionEvent>()) {
                       failures += event.action == "failed" ? 1 : 0;
                     }
                     require(failures == 2, "failures reported");
                   }});

  tests.push_back({"extension_duplicate_names_rejected", [] {
                     TempWorkspace ws;
                     install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo_a.so");
                     install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo_b.so");
                     extensions::ExtensionRegistry registry(ws.path() / "extensions");
                     const auto summary = registry.load();
                     require(summary.loaded == 1 && summary.failed == 1, "second copy rejected");
                     require(summary.errors[0].find("already loaded") != std::string::npos,
                             summary.errors[0]);
                   }});

  tests.push_back({"extension_disable_hides_tools", [] {
                     TempWorkspace ws;
                     install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo.so");
                     auto registry =
                         std::make_shared<extensions::ExtensionRegistry>(ws.path() / "extensions");
                     static_cast<void>(registry->load());
                     tools::Dispatcher dispatcher;
                     dispatcher.attach_provider(registry);

                     require(registry->set_enabled("ECHO", false), "disable by name");
                     require(registry->tool_specs().empty(), "no specs while disabled");
                     require(dispatcher.execute("extension_echo_say", {{"text", std::string("x")}})
                                     .kind == common::ErrorCode::NotFound,
                             "disabled tools are not found");
                     require(registry->set_enabled("echo", true), "re-enable");
                     require(dispatcher.execute("extension_echo_say", {{"text", std::string("x")}})
                                 .success,
                             "enabled again");
                     require(!registry->set_enabled("ghost", true), "unknown name");
                   }});

  tests.push_back({"extension_removed_package_is_gone_after_reload", [] {
                     TempWorkspace ws;
                     const auto package = install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo.so");
                     extensions::ExtensionRegistry registry(ws.path() / "extensions");
                     require(registry.load().loaded == 1, "initial load");

                     std::filesystem::remove(package);
                     const auto summary = registry.reload();
                     require(summary.loaded == 0 && summary.failed == 0, "nothing left to load");
                     require(registry.get_loaded().empty(), "removed extension absent");
                     require(registry.find_tool("extension_echo_say") == nullptr, "tools gone");
                   }});

  tests.push_back({"extension_load_is_idempotent", [] {
                     TempWorkspace ws;
                     install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo.so");
                     extensions::ExtensionRegistry registry(ws.path() / "extensions");
                     require(registry.load().loaded == 1, "first load");
                     const auto again = registry.load();
                     require(again.loaded == 0 && again.failed == 0, "already loaded packages skipped");
                     require(registry.get_loaded().size() == 1, "still one");
                   }});

  tests.push_back({"extension_in_process_registration", [] {
                     TempWorkspace ws;
                     auto registry =
                         std::make_shared<extensions::ExtensionRegistry>(ws.path() / "extensions");
                     require(registry->register_extension(std::make_shared<StaticExtension>("Static")),
                             "register");
                     require(!registry->register_extension(std::make_shared<StaticExtension>("static")),
                             "duplicate name rejected");
                     require(!registry->register_extension(
                                 std::make_shared<StaticExtension>("broken", true)),
                             "failed init rejected");

                     tools::Dispatcher dispatcher;
                     dispatcher.attach_provider(registry);
                     const auto result = dispatcher.execute("extension_static_ping", {});
                     require(result.success && result.output == "pong", "static tool runs");
                     const auto specs = dispatcher.all_specs();
                     require(specs.size() == 1 && specs[0].group == "extension", "spec exposed");
                     require(registry->get_loaded()[0].origin.empty(), "no origin for in-process");

                     require(registry->unregister("static"), "unregister");
                     require(!registry->unregister("static"), "second unregister");
                     require(dispatcher.execute("extension_static_ping", {}).kind ==
                                 common::ErrorCode::NotFound,
                             "tool gone");
                   }});

  tests.push_back({"extension_namespaced_name_collision_rejected", [] {
                     TempWorkspace ws;
                     hostgate::testing::ObserverCapture capture;
                     auto registry =
                         std::make_shared<extensions::ExtensionRegistry>(ws.path() / "extensions");
                     require(registry->register_extension(
                                 std::make_shared<StaticExtension>("a_b", false, "c")),
                             "first owner registers");
                     require(!registry->register_extension(
                                 std::make_shared<StaticExtension>("a", false, "b_c")),
                             "same namespaced name rejected");

                     const auto specs = registry->tool_specs();
                     require(specs.size() == 1 && specs[0].name == "extension_a_b_c",
                             "tool listed once");
                     const auto loaded = registry->get_loaded();
                     require(loaded.size() == 1 && loaded[0].name == "a_b", "first owner kept");

                     bool reported = false;
                     for (const auto &event :
                          capture.observer().events_of<hostgate::observability::ExtensionEvent>()) {
                       reported = reported || (event.extension == "a" && event.action == "failed" &&
                                               event.detail.find("already provided by extension "
                                                                 "'a_b'") != std::string::npos);
                     }
                     require(reported, "rejection logged");

                     require(registry->unregister("a_b"), "owner removed");
                     require(registry->register_extension(
                                 std::make_shared<StaticExtension>("a", false, "b_c")),
                             "name free again");
                   }});

  tests.push_back({"extension_tool_cancellation_reaches_plugin", [] {
                     TempWorkspace ws;
                     install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo.so");
                     auto registry =
                         std::make_shared<extensions::ExtensionRegistry>(ws.path() / "extensions");
                     static_cast<void>(registry->load());
                     tools::Dispatcher dispatcher;
                     dispatcher.attach_provider(registry);

                     common::CancellationSource source;
                     auto pending = dispatcher.execute_async("extension_echo_wait", {}, std::nullopt,
                                                             source.token());
                     std::this_thread::sleep_for(std::chrono::milliseconds(50));
                     source.cancel();
                     const auto cancelled = pending.get();
                     require(cancelled.cancelled(), "caller cancellation");

                     const auto timed_out = dispatcher.execute("extension_echo_wait", {},
                                                               std::chrono::milliseconds(50));
                     require(timed_out.timed_out(), "timeout");
                   }});
  tests.push_back({"runtime_gateway_wires_builtins_then_extensions", [] {
                     TempWorkspace ws;
                     install_package(ws, HOSTGATE_TEST_PLUGIN_PATH, "echo.so");
                     auto config = hostgate::testing::temp_config(ws);
                     config.gateway.default_timeout_ms = 2000;
                     const hostgate::runtime::RuntimeContext runtime(config);
                     const auto gateway = runtime.create_gateway();
                     require(gateway.ok(), gateway.error());
                     const auto &dispatcher = *gateway.value().dispatcher;
                     require(dispatcher.options().default_timeout == std::chrono::milliseconds(2000),
                             "timeout from config");
                     const auto specs = dispatcher.all_specs();
                     require(specs.size() == 13, "eleven built-ins plus two extension tools");
                     require(specs.front().name == "read_file", "built-ins first");
                     require(specs.back().name == "extension_echo_wait", "extensions last");

                     config.extensions.enabled = false;
                     const auto bare = hostgate::runtime::RuntimeContext(config).create_gateway();
                     require(bare.ok() && bare.value().extensions == nullptr, "extensions off");
                     require(bare.value().dispatcher->all_specs().size() == 11, "built-ins only");
                   }});

  tests.push_back({"runtime_credential_store_uses_config_paths", [] {
                     TempWorkspace ws;
                     const hostgate::runtime::RuntimeContext runtime(hostgate::testing::temp_config(ws));
                     const auto store = runtime.create_credential_store();
                     require(store.ok(), store.error());
                     require(store.value()->store("k", "v").ok(), "store");
                     require(std::filesystem::exists(ws.path() / "secure_storage.dat"), "store file");
                     require(std::filesystem::exists(ws.path() / "secrets.key"), "key file");
                   }});
}
