#pragma once

#include "hostgate/process/process_manager.hpp"
#include "hostgate/tools/tool.hpp"

#include <memory>

namespace hostgate::tools {

/// Command evaluation, then path resolution, then a shell-less launch.
class LaunchApplicationTool final : public ITool {
public:
  explicit LaunchApplicationTool(std::shared_ptr<process::ProcessManager> processes);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ParamSpec> parameters() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<process::ProcessManager> processes_;
};

class CloseApplicationTool final : public ITool {
public:
  explicit CloseApplicationTool(std::shared_ptr<process::ProcessManager> processes);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ParamSpec> parameters() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<process::ProcessManager> processes_;
};

class GetRunningApplicationsTool final : public ITool {
public:
  explicit GetRunningApplicationsTool(std::shared_ptr<process::ProcessManager> processes);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ParamSpec> parameters() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<process::ProcessManager> processes_;
};

/// Renders the running-process table shown by get_running_applications.
[[nodiscard]] std::string format_process_table(const std::vector<process::ProcessInfo> &processes,
                                               std::size_t max_rows = 100);

} // namespace hostgate::tools
