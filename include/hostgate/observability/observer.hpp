#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace hostgate::observability {

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
  /// error_code_name() of the outcome, "completed" on success.
  std::string outcome;
};

struct SecurityDenialEvent {
  std::string tool;
  std::string reason;
};

struct ExtensionEvent {
  std::string extension;
  /// loaded, failed, registered, unregistered, enabled, disabled, reloaded
  std::string action;
  std::string detail;
};

struct ProcessEvent {
  /// launched, terminated, protected, failed
  std::string action;
  std::int64_t pid = 0;
  std::string name;
  std::string detail;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ToolCallEvent, SecurityDenialEvent, ExtensionEvent, ProcessEvent, ErrorEvent>;

struct ToolLatencyMetric {
  std::string tool;
  std::chrono::milliseconds latency{0};
};

struct LoadedExtensionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ToolLatencyMetric, LoadedExtensionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hostgate::observability
