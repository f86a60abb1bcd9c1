#include "hostgate/cli/commands.hpp"

#include "hostgate/cli/serve.hpp"
#include "hostgate/common/fs.hpp"
#include "hostgate/config/config.hpp"
#include "hostgate/runtime/app.hpp"
#include "hostgate/security/command_policy.hpp"

#include <chrono>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace hostgate::cli {

namespace {

std::string version_string() {
#ifdef HOSTGATE_VERSION
  std::string version = HOSTGATE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "hostgate " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string format_time(const std::chrono::system_clock::time_point point) {
  const std::time_t raw = std::chrono::system_clock::to_time_t(point);
  std::tm tm{};
  localtime_r(&raw, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

common::Result<runtime::RuntimeContext> load_context() {
  auto context = runtime::RuntimeContext::from_disk();
  if (context.ok()) {
    context.value().install_observer();
  }
  return context;
}

common::Result<runtime::Gateway> load_gateway() {
  auto context = load_context();
  if (!context.ok()) {
    return common::Result<runtime::Gateway>::failure(context.status());
  }
  return context.value().create_gateway();
}

int run_serve(const std::vector<std::string> &args) {
  if (!args.empty()) {
    std::cerr << "usage: hostgate serve\n";
    return 1;
  }
  auto gateway = load_gateway();
  if (!gateway.ok()) {
    std::cerr << gateway.error() << "\n";
    return 1;
  }
  return serve_ndjson(*gateway.value().dispatcher, std::cin, std::cout);
}

int run_exec(std::vector<std::string> args) {
  std::optional<std::chrono::milliseconds> timeout;
  std::string value;
  if (take_option(args, "--timeout", value)) {
    std::int64_t ms = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
    if (ec != std::errc() || ptr != value.data() + value.size() || ms <= 0) {
      std::cerr << "--timeout expects a positive number of milliseconds\n";
      return 1;
    }
    timeout = std::chrono::milliseconds(ms);
  }
  if (args.empty() || args.size() > 2) {
    std::cerr << "usage: hostgate exec <tool> [json-arguments] [--timeout <ms>]\n";
    return 1;
  }

  auto parsed = tools::parse_tool_args(args.size() == 2 ? args[1] : std::string());
  if (!parsed.ok()) {
    std::cerr << parsed.error() << "\n";
    return 1;
  }

  auto gateway = load_gateway();
  if (!gateway.ok()) {
    std::cerr << gateway.error() << "\n";
    return 1;
  }
  const auto result = gateway.value().dispatcher->execute(args[0], parsed.value(), timeout);
  std::cout << format_response(std::nullopt, result) << "\n";
  return result.success ? 0 : 1;
}

int run_tools() {
  auto gateway = load_gateway();
  if (!gateway.ok()) {
    std::cerr << gateway.error() << "\n";
    return 1;
  }
  for (const auto &spec : gateway.value().dispatcher->all_specs()) {
    std::cout << std::left << std::setw(40) << spec.name << " " << spec.description << "\n";
    for (const auto &param : spec.parameters) {
      std::cout << "    " << param.name << " (" << tools::param_type_name(param.type)
                << (param.required ? ", required" : "") << ")";
      if (!param.description.empty()) {
        std::cout << "  " << param.description;
      }
      std::cout << "\n";
    }
  }
  return 0;
}

int run_check(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: hostgate check <path> [arguments...]\n";
    return 1;
  }
  const auto decision = security::evaluate_command(args[0], join_tokens(args, 1));
  if (decision.allowed) {
    std::cout << "allowed\n";
    return 0;
  }
  std::cout << "denied: " << decision.reason.value_or("") << "\n";
  return 2;
}

int run_extensions(const std::vector<std::string> &args) {
  const std::string action = args.empty() ? "list" : args[0];
  if (action != "list" && action != "reload") {
    std::cerr << "usage: hostgate extensions [list|reload]\n";
    return 1;
  }

  auto gateway = load_gateway();
  if (!gateway.ok()) {
    std::cerr << gateway.error() << "\n";
    return 1;
  }
  const auto &registry = gateway.value().extensions;
  if (registry == nullptr) {
    std::cout << "Extensions are disabled (extensions.enabled = false)\n";
    return 0;
  }

  if (action == "reload") {
    const auto summary = registry->reload();
    std::cout << "Reloaded " << summary.loaded << " extension(s), " << summary.failed
              << " failed\n";
    for (const auto &error : summary.errors) {
      std::cout << "  " << error << "\n";
    }
  }

  const auto loaded = registry->get_loaded();
  std::cout << "Extensions in " << registry->directory().string() << ": " << loaded.size()
            << "\n";
  for (const auto &descriptor : loaded) {
    std::cout << "  " << descriptor.name << " " << descriptor.version
              << (descriptor.enabled ? "" : " (disabled)") << "  installed "
              << format_time(descriptor.installed_at) << "\n";
    for (const auto &tool : descriptor.tools) {
      std::cout << "    " << tool << "\n";
    }
  }
  return 0;
}

int run_secret(const std::vector<std::string> &args) {
  const std::string usage = "usage: hostgate secret set <key> <value> | get <key> | "
                            "delete <key> | list | clear";
  if (args.empty()) {
    std::cerr << usage << "\n";
    return 1;
  }

  auto context = load_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto opened = context.value().create_credential_store();
  if (!opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto &store = *opened.value();

  const std::string &action = args[0];
  if (action == "set" && args.size() == 3) {
    if (auto stored = store.store(args[1], args[2]); !stored.ok()) {
      std::cerr << stored.error() << "\n";
      return 1;
    }
    std::cout << "Stored " << args[1] << "\n";
    return 0;
  }
  if (action == "get" && args.size() == 2) {
    auto value = store.retrieve(args[1]);
    if (!value.ok()) {
      std::cerr << value.error() << "\n";
      return 1;
    }
    if (!value.value().has_value()) {
      std::cerr << "No secret named " << args[1] << "\n";
      return 1;
    }
    std::cout << *value.value() << "\n";
    return 0;
  }
  if (action == "delete" && args.size() == 2) {
    auto removed = store.remove(args[1]);
    if (!removed.ok()) {
      std::cerr << removed.error() << "\n";
      return 1;
    }
    std::cout << (removed.value() ? "Deleted " : "No secret named ") << args[1] << "\n";
    return removed.value() ? 0 : 1;
  }
  if (action == "list" && args.size() == 1) {
    for (const auto &key : store.list_keys()) {
      std::cout << key << "\n";
    }
    return 0;
  }
  if (action == "clear" && args.size() == 1) {
    if (auto cleared = store.clear(); !cleared.ok()) {
      std::cerr << cleared.error() << "\n";
      return 1;
    }
    std::cout << "Cleared all secrets\n";
    return 0;
  }

  std::cerr << usage << "\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << " - local command-execution gateway\n\n";
  std::cout << "usage: hostgate [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  serve                                Serve NDJSON tool requests on stdin/stdout\n";
  std::cout << "  exec <tool> [json] [--timeout MS]    Run one tool call and print the result\n";
  std::cout << "  tools                                List available tools\n";
  std::cout << "  check <path> [arguments...]          Evaluate a launch against the policy\n";
  std::cout << "  extensions [list|reload]             Show or reload extensions\n";
  std::cout << "  secret set|get|delete|list|clear     Manage stored credentials\n";
  std::cout << "  config-path                          Print the config file location\n";
  std::cout << "  version                              Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(args);
  }
  if (subcommand == "exec") {
    return run_exec(std::move(args));
  }
  if (subcommand == "tools") {
    return run_tools();
  }
  if (subcommand == "check") {
    return run_check(args);
  }
  if (subcommand == "extensions") {
    return run_extensions(args);
  }
  if (subcommand == "secret") {
    return run_secret(args);
  }

  std::cerr << "unknown command: " << subcommand << "\n\n";
  print_help();
  return 1;
}

} // namespace hostgate::cli
