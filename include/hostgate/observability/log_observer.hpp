#pragma once

#include "hostgate/observability/observer.hpp"

#include <mutex>
#include <ostream>
#include <string>

namespace hostgate::observability {

enum class LogLevel { Debug, Info, Warn, Error };

/// Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(const std::string &name);

class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  /// Writes to `out` instead of stderr. The stream must outlive the observer.
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace hostgate::observability
