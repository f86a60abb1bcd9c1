#pragma once

#include "hostgate/common/cancellation.hpp"
#include "hostgate/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostgate::process {

struct ProcessInfo {
  std::int64_t pid = 0;
  std::string name;
  /// The POSIX backend queries no window system and leaves this empty.
  std::optional<std::string> window_title;
  double memory_mb = 0.0;
};

struct LaunchedProcess {
  std::int64_t pid = 0;
  std::filesystem::path path;
};

enum class TerminateStatus { Graceful, Forced, InvalidPid, NotFound, Protected, Cancelled, Failed };

[[nodiscard]] std::string_view terminate_status_name(TerminateStatus status);

struct TerminationResult {
  TerminateStatus status = TerminateStatus::Failed;
  std::string process_name;
  std::string message;

  [[nodiscard]] bool ok() const {
    return status == TerminateStatus::Graceful || status == TerminateStatus::Forced;
  }
};

struct TerminationTimings {
  std::chrono::milliseconds crash_check{100};
  std::chrono::milliseconds graceful_window{3000};
  std::chrono::milliseconds kill_window{5000};
  std::chrono::milliseconds poll_interval{100};
};

/// Host process table access. The POSIX implementation reads /proc and uses signals.
class IProcessBackend {
public:
  virtual ~IProcessBackend() = default;

  /// Starts `argv[0]` directly (no shell) in its own session.
  [[nodiscard]] virtual common::Result<std::int64_t>
  spawn(const std::filesystem::path &executable, const std::vector<std::string> &argv,
        const std::optional<std::filesystem::path> &working_directory) = 0;
  /// Exit code of a child that has already finished, reaping it. Signals map to 128 + signo.
  /// A code is reported once; launched children are reaped in the background.
  [[nodiscard]] virtual std::optional<int> poll_exit(std::int64_t pid) = 0;

  /// nullopt when no such process exists.
  [[nodiscard]] virtual std::optional<std::string> name_of(std::int64_t pid) = 0;
  [[nodiscard]] virtual bool has_main_window(std::int64_t pid) = 0;
  [[nodiscard]] virtual common::Status request_close(std::int64_t pid) = 0;
  [[nodiscard]] virtual common::Status force_kill(std::int64_t pid) = 0;
  [[nodiscard]] virtual bool is_alive(std::int64_t pid) = 0;
  [[nodiscard]] virtual std::vector<ProcessInfo> list() = 0;
};

[[nodiscard]] std::shared_ptr<IProcessBackend> make_posix_backend();

/// Splits a command-line argument string on whitespace. Single and double quotes group, a
/// backslash escapes the next character outside single quotes.
[[nodiscard]] std::vector<std::string> tokenize_arguments(const std::string &arguments);

/// Session managers, window managers and core service hosts that are never terminated.
[[nodiscard]] bool is_protected_process(std::string_view name);

class ProcessManager {
public:
  explicit ProcessManager(std::shared_ptr<IProcessBackend> backend = make_posix_backend(),
                          TerminationTimings timings = {});

  /// Existing regular file as an absolute path (symlinks kept, so multi-call binaries still
  /// see their own argv[0]), otherwise a PATH search for any relative name trying
  /// the suffixes "", ".sh", ".py", ".AppImage" in that order. Absolute paths are never searched.
  [[nodiscard]] static std::optional<std::filesystem::path>
  resolve_path(const std::string &candidate);

  [[nodiscard]] common::Result<LaunchedProcess>
  launch(const std::filesystem::path &executable, const std::string &arguments,
         const std::optional<std::filesystem::path> &working_directory,
         const common::CancellationToken &cancel = {});

  /// Graceful close for windowed processes, then forced termination.
  [[nodiscard]] TerminationResult terminate(std::int64_t pid,
                                            const common::CancellationToken &cancel = {});

  /// Sorted by name, then pid.
  [[nodiscard]] std::vector<ProcessInfo> list_running() const;

  [[nodiscard]] const TerminationTimings &timings() const { return timings_; }

private:
  enum class WaitOutcome { Exited, TimedOut, Cancelled };
  WaitOutcome wait_for_exit(std::int64_t pid, std::chrono::milliseconds window,
                            const common::CancellationToken &cancel);

  std::shared_ptr<IProcessBackend> backend_;
  TerminationTimings timings_;
};

} // namespace hostgate::process
