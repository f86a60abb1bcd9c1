#include "hostgate/observability/global.hpp"

#include <mutex>

namespace hostgate::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_tool_call(const std::string &tool, const std::chrono::milliseconds duration,
                      const bool success, const std::string &outcome) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .success = success,
                             .outcome = outcome});
  record_metric(ToolLatencyMetric{.tool = tool, .latency = duration});
}

void record_security_denial(const std::string &tool, const std::string &reason) {
  record_event(SecurityDenialEvent{.tool = tool, .reason = reason});
}

void record_extension(const std::string &extension, const std::string &action,
                      const std::string &detail) {
  record_event(ExtensionEvent{.extension = extension, .action = action, .detail = detail});
}

void record_process(const std::string &action, const std::int64_t pid, const std::string &name,
                    const std::string &detail) {
  record_event(ProcessEvent{.action = action, .pid = pid, .name = name, .detail = detail});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace hostgate::observability
