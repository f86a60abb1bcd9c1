#pragma once

#include "hostgate/process/process_manager.hpp"
#include "hostgate/tools/dispatcher.hpp"

#include <memory>

namespace hostgate::tools {

/// File, text and application tools, in that order.
[[nodiscard]] common::Status register_builtin_tools(Dispatcher &dispatcher,
                                                    std::shared_ptr<process::ProcessManager> processes);

} // namespace hostgate::tools
