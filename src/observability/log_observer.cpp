#include "hostgate/observability/log_observer.hpp"

#include "hostgate/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace hostgate::observability {

namespace {

const char *level_label(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

LogLevel parse_log_level(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level_label(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ToolCallEvent>) {
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn,
                   "tool.call name=" + evt.tool + " outcome=" + evt.outcome +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SecurityDenialEvent>) {
          log_line(LogLevel::Warn, "security.deny tool=" + evt.tool + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ExtensionEvent>) {
          const LogLevel level = evt.action == "failed" ? LogLevel::Error : LogLevel::Info;
          std::string line = "extension." + evt.action + " name=" + evt.extension;
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          log_line(level, line);
        } else if constexpr (std::is_same_v<T, ProcessEvent>) {
          std::string line =
              "process." + evt.action + " pid=" + std::to_string(evt.pid) + " name=" + evt.name;
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          log_line(evt.action == "failed" ? LogLevel::Warn : LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ToolLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.tool_latency_ms tool=" + m.tool +
                                        " value=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, LoadedExtensionsMetric>) {
          log_line(LogLevel::Debug, "metric.loaded_extensions=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace hostgate::observability
