#pragma once

#include "hostgate/tools/dispatcher.hpp"

#include <atomic>
#include <functional>
#include <iosfwd>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace hostgate::cli {

/// One NDJSON response line (without the trailing newline). A missing id is written as null.
[[nodiscard]] std::string format_response(const std::optional<std::string> &id,
                                          const tools::ToolResult &result);

/// Request threads of one serve session. Finished threads are joined by `reap_finished`, so
/// a long session holds only the threads still running.
class RequestWorkers {
public:
  RequestWorkers() = default;
  RequestWorkers(const RequestWorkers &) = delete;
  RequestWorkers &operator=(const RequestWorkers &) = delete;
  ~RequestWorkers();

  void spawn(std::function<void()> work);
  /// Joins every thread whose work has returned. Returns how many were joined.
  std::size_t reap_finished();
  void join_all();
  [[nodiscard]] std::size_t size() const { return workers_.size(); }

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  std::list<Worker> workers_;
};

/// Reads requests from `in` until EOF and writes one response line per request to `out`.
///
///   {"id":"1","tool":"read_file","arguments":{"path":"/x"},"timeout_ms":5000}
///   {"cancel":"1"}
///
/// Requests run concurrently; responses are written as they complete, so callers match them
/// by id. A cancel for an unknown id is answered with a not_found line. Returns once every
/// in-flight request has been answered.
int serve_ndjson(const tools::Dispatcher &dispatcher, std::istream &in, std::ostream &out);

} // namespace hostgate::cli
