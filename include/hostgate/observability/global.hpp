#pragma once

#include "hostgate/observability/observer.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace hostgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success,
                      const std::string &outcome);
void record_security_denial(const std::string &tool, const std::string &reason);
void record_extension(const std::string &extension, const std::string &action,
                      const std::string &detail = "");
void record_process(const std::string &action, std::int64_t pid, const std::string &name,
                    const std::string &detail = "");
void record_error(const std::string &component, const std::string &message);

} // namespace hostgate::observability
