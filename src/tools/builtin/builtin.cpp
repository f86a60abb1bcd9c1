#include "hostgate/tools/builtin/builtin.hpp"

#include "hostgate/tools/builtin/app_tools.hpp"
#include "hostgate/tools/builtin/file_tools.hpp"
#include "hostgate/tools/builtin/text_tools.hpp"

namespace hostgate::tools {

common::Status register_builtin_tools(Dispatcher &dispatcher,
                                      std::shared_ptr<process::ProcessManager> processes) {
  const std::vector<std::shared_ptr<ITool>> tools = {
      std::make_shared<ReadFileTool>(),
      std::make_shared<WriteFileTool>(),
      std::make_shared<ListDirectoryTool>(),
      std::make_shared<ReadTextFileTool>(),
      std::make_shared<WriteTextFileTool>(),
      std::make_shared<AppendToFileTool>(),
      std::make_shared<SearchInFileTool>(),
      std::make_shared<ReplaceInFileTool>(),
      std::make_shared<LaunchApplicationTool>(processes),
      std::make_shared<CloseApplicationTool>(processes),
      std::make_shared<GetRunningApplicationsTool>(processes),
  };
  for (const auto &tool : tools) {
    if (auto status = dispatcher.register_tool(tool); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

} // namespace hostgate::tools
