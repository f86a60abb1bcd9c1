#include "hostgate/tools/builtin/app_tools.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/security/command_policy.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>

namespace hostgate::tools {

namespace {

common::Result<ToolResult> refuse(std::string reason, const common::ErrorCode kind) {
  return common::Result<ToolResult>::success(ToolResult::fail(std::move(reason), kind));
}

common::ErrorCode termination_kind(const process::TerminateStatus status) {
  switch (status) {
  case process::TerminateStatus::Graceful:
  case process::TerminateStatus::Forced:
    return common::ErrorCode::None;
  case process::TerminateStatus::InvalidPid:
    return common::ErrorCode::Validation;
  case process::TerminateStatus::NotFound:
    return common::ErrorCode::NotFound;
  case process::TerminateStatus::Protected:
    return common::ErrorCode::Protected;
  case process::TerminateStatus::Cancelled:
    return common::ErrorCode::Cancelled;
  case process::TerminateStatus::Failed:
    return common::ErrorCode::Faulted;
  }
  return common::ErrorCode::Faulted;
}

std::string clip_title(const std::optional<std::string> &title) {
  if (!title.has_value() || title->empty()) {
    return "(background)";
  }
  if (title->size() > 40) {
    return title->substr(0, 37) + "...";
  }
  return *title;
}

} // namespace

std::string format_process_table(const std::vector<process::ProcessInfo> &processes,
                                 const std::size_t max_rows) {
  std::ostringstream out;
  out << "Running applications: " << processes.size() << "\n\n";
  out << std::left << std::setw(8) << "PID" << " " << std::setw(25) << "Name" << " "
      << std::setw(40) << "Window Title" << " " << "Memory (MB)" << "\n";
  out << std::string(85, '-') << "\n";

  std::size_t shown = 0;
  for (const auto &info : processes) {
    if (shown == max_rows) {
      break;
    }
    out << std::left << std::setw(8) << info.pid << " " << std::setw(25) << info.name << " "
        << std::setw(40) << clip_title(info.window_title) << " " << std::fixed
        << std::setprecision(1) << info.memory_mb << "\n";
    ++shown;
  }
  if (processes.size() > shown) {
    out << "\n... " << (processes.size() - shown) << " more processes\n";
  }
  return out.str();
}

// launch_application

LaunchApplicationTool::LaunchApplicationTool(std::shared_ptr<process::ProcessManager> processes)
    : processes_(std::move(processes)) {}

std::string_view LaunchApplicationTool::name() const { return "launch_application"; }

std::string_view LaunchApplicationTool::description() const {
  return "Start an application without a shell and return its process id";
}

std::vector<ParamSpec> LaunchApplicationTool::parameters() const {
  return {{.name = "path", .type = ParamType::String, .required = true,
           .description = "Executable path or a name found on PATH"},
          {.name = "arguments", .type = ParamType::String, .required = false,
           .description = "Command-line arguments; quotes group words"},
          {.name = "working_directory", .type = ParamType::String, .required = false,
           .description = "Directory to start in"}};
}

common::Result<ToolResult> LaunchApplicationTool::execute(const ToolArgs &args,
                                                          const ToolContext &ctx) {
  if (processes_ == nullptr) {
    return common::Result<ToolResult>::failure("process manager unavailable");
  }
  const std::string path = get_string(args, "path").value_or("");
  const std::string arguments = get_string(args, "arguments").value_or("");
  if (common::trim(path).empty()) {
    return refuse("Parameter 'path' must not be empty", common::ErrorCode::Validation);
  }

  if (const auto decision = security::evaluate_command(path, arguments); !decision.allowed) {
    return refuse(decision.reason.value_or("Command denied"), common::ErrorCode::SecurityDenied);
  }

  const auto resolved = process::ProcessManager::resolve_path(path);
  if (!resolved.has_value()) {
    return refuse("Application not found: " + path, common::ErrorCode::NotFound);
  }
  // a PATH hit or a symlink may land on a different executable name
  std::error_code ec;
  const auto target = std::filesystem::canonical(*resolved, ec);
  for (const auto &candidate : {*resolved, ec ? *resolved : target}) {
    if (const auto decision = security::evaluate_command(candidate.string(), arguments);
        !decision.allowed) {
      return refuse(decision.reason.value_or("Command denied"), common::ErrorCode::SecurityDenied);
    }
  }

  std::optional<std::filesystem::path> working_directory;
  if (const auto wd = get_string(args, "working_directory");
      wd.has_value() && !common::trim(*wd).empty()) {
    working_directory = std::filesystem::path(common::expand_path(*wd));
  }

  auto launched = processes_->launch(*resolved, arguments, working_directory, ctx.cancel);
  if (!launched.ok()) {
    return refuse(launched.error(), launched.code());
  }

  const auto &info = launched.value();
  auto result = ToolResult::ok("Launched application (PID: " + std::to_string(info.pid) +
                               ", Path: " + info.path.string() + ")");
  result.metadata["pid"] = std::to_string(info.pid);
  return common::Result<ToolResult>::success(std::move(result));
}

bool LaunchApplicationTool::is_safe() const { return false; }

std::string_view LaunchApplicationTool::group() const { return "process"; }

// close_application

CloseApplicationTool::CloseApplicationTool(std::shared_ptr<process::ProcessManager> processes)
    : processes_(std::move(processes)) {}

std::string_view CloseApplicationTool::name() const { return "close_application"; }

std::string_view CloseApplicationTool::description() const {
  return "Close an application by process id, gracefully first and then forcibly";
}

std::vector<ParamSpec> CloseApplicationTool::parameters() const {
  return {{.name = "process_id", .type = ParamType::Integer, .required = true,
           .description = "Process id to terminate"}};
}

common::Result<ToolResult> CloseApplicationTool::execute(const ToolArgs &args,
                                                         const ToolContext &ctx) {
  if (processes_ == nullptr) {
    return common::Result<ToolResult>::failure("process manager unavailable");
  }
  const auto pid = get_int(args, "process_id").value_or(0);
  const auto outcome = processes_->terminate(pid, ctx.cancel);

  ToolResult result = outcome.ok() ? ToolResult::ok(outcome.message)
                                   : ToolResult::fail(outcome.message,
                                                      termination_kind(outcome.status));
  result.metadata["status"] = std::string(process::terminate_status_name(outcome.status));
  if (!outcome.process_name.empty()) {
    result.metadata["process_name"] = outcome.process_name;
  }
  return common::Result<ToolResult>::success(std::move(result));
}

bool CloseApplicationTool::is_safe() const { return false; }

std::string_view CloseApplicationTool::group() const { return "process"; }

// get_running_applications

GetRunningApplicationsTool::GetRunningApplicationsTool(
    std::shared_ptr<process::ProcessManager> processes)
    : processes_(std::move(processes)) {}

std::string_view GetRunningApplicationsTool::name() const { return "get_running_applications"; }

std::string_view GetRunningApplicationsTool::description() const {
  return "List running processes with window title and memory use";
}

std::vector<ParamSpec> GetRunningApplicationsTool::parameters() const { return {}; }

common::Result<ToolResult> GetRunningApplicationsTool::execute(const ToolArgs &,
                                                               const ToolContext &) {
  if (processes_ == nullptr) {
    return common::Result<ToolResult>::failure("process manager unavailable");
  }
  const auto processes = processes_->list_running();
  auto result = ToolResult::ok(format_process_table(processes));
  result.truncated = processes.size() > 100;
  result.metadata["count"] = std::to_string(processes.size());
  return common::Result<ToolResult>::success(std::move(result));
}

bool GetRunningApplicationsTool::is_safe() const { return true; }

std::string_view GetRunningApplicationsTool::group() const { return "process"; }

} // namespace hostgate::tools
