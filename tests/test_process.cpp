#include "test_framework.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/process/process_manager.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <thread>

namespace {

namespace process = hostgate::process;
namespace common = hostgate::common;

/// Scripted process table. A process dies on request_close only when it has a window and
/// honours_close is set, and on force_kill unless survives_kill is set.
class FakeProcessBackend final : public process::IProcessBackend {
public:
  struct Entry {
    std::string name;
    bool window = false;
    bool honours_close = true;
    bool survives_kill = false;
    bool alive = true;
  };

  void add(const std::int64_t pid, Entry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    table_[pid] = std::move(entry);
  }

  common::Result<std::int64_t> spawn(const std::filesystem::path &, const std::vector<std::string> &argv,
                                     const std::optional<std::filesystem::path> &) override {
    std::lock_guard<std::mutex> lock(mutex_);
    last_argv = argv;
    return common::Result<std::int64_t>::success(4242);
  }

  std::optional<int> poll_exit(std::int64_t) override { return std::nullopt; }

  std::optional<std::string> name_of(const std::int64_t pid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = table_.find(pid);
    if (it == table_.end() || !it->second.alive) {
      return std::nullopt;
    }
    return it->second.name;
  }

  bool has_main_window(const std::int64_t pid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.at(pid).window;
  }

  common::Status request_close(const std::int64_t pid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++close_requests;
    auto &entry = table_.at(pid);
    if (entry.honours_close) {
      entry.alive = false;
    }
    return common::Status::success();
  }

  common::Status force_kill(const std::int64_t pid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++kill_requests;
    auto &entry = table_.at(pid);
    if (!entry.survives_kill) {
      entry.alive = false;
    }
    return common::Status::success();
  }

  bool is_alive(const std::int64_t pid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = table_.find(pid);
    return it != table_.end() && it->second.alive;
  }

  std::vector<process::ProcessInfo> list() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<process::ProcessInfo> out;
    for (const auto &[pid, entry] : table_) {
      if (entry.alive) {
        out.push_back(process::ProcessInfo{.pid = pid, .name = entry.name});
      }
    }
    return out;
  }

  int close_requests = 0;
  int kill_requests = 0;
  std::vector<std::string> last_argv;

private:
  std::mutex mutex_;
  std::map<std::int64_t, Entry> table_;
};

process::TerminationTimings fast_timings() {
  return process::TerminationTimings{.crash_check = std::chrono::milliseconds(10),
                                     .graceful_window = std::chrono::milliseconds(100),
                                     .kill_window = std::chrono::milliseconds(100),
                                     .poll_interval = std::chrono::milliseconds(5)};
}

} // namespace

void register_process_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;

  tests.push_back({"process_windowless_skips_graceful_phase", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     backend->add(100, {.name = "worker", .window = false});
                     process::ProcessManager manager(backend, fast_timings());
                     const auto result = manager.terminate(100);
                     require(result.status == process::TerminateStatus::Forced, result.message);
                     require(backend->close_requests == 0, "no close request without a window");
                     require(backend->kill_requests == 1, "one kill");
                   }});

  tests.push_back({"process_windowed_closes_gracefully", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     backend->add(101, {.name = "editor", .window = true});
                     process::ProcessManager manager(backend, fast_timings());
                     const auto result = manager.terminate(101);
                     require(result.status == process::TerminateStatus::Graceful, result.message);
                     require(result.process_name == "editor", "name reported");
                     require(backend->kill_requests == 0, "no kill after graceful exit");
                   }});

  tests.push_back({"process_graceful_timeout_falls_back_to_kill", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     backend->add(102, {.name = "stubborn", .window = true, .honours_close = false});
                     process::ProcessManager manager(backend, fast_timings());
                     const auto result = manager.terminate(102);
                     require(result.status == process::TerminateStatus::Forced, result.message);
                     require(backend->close_requests == 1 && backend->kill_requests == 1,
                             "close then kill");
                   }});

  tests.push_back({"process_protected_is_never_signalled", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     backend->add(1, {.name = "systemd", .window = true});
                     backend->add(2, {.name = "Explorer"});
                     process::ProcessManager manager(backend, fast_timings());
                     require(manager.terminate(1).status == process::TerminateStatus::Protected,
                             "systemd protected");
                     require(manager.terminate(2).status == process::TerminateStatus::Protected,
                             "case-insensitive match");
                     require(backend->close_requests == 0 && backend->kill_requests == 0,
                             "no signals sent");
                     require(backend->is_alive(1), "still running");
                   }});

  tests.push_back({"process_invalid_and_missing_pids", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     process::ProcessManager manager(backend, fast_timings());
                     require(manager.terminate(0).status == process::TerminateStatus::InvalidPid,
                             "zero pid");
                     require(manager.terminate(-5).status == process::TerminateStatus::InvalidPid,
                             "negative pid");
                     const auto missing = manager.terminate(999);
                     require(missing.status == process::TerminateStatus::NotFound, "missing pid");
                     require(missing.message == "Process ID 999 was not found", missing.message);
                   }});

  tests.push_back({"process_survives_kill_reports_failed", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     backend->add(103, {.name = "zombie", .survives_kill = true});
                     process::ProcessManager manager(backend, fast_timings());
                     const auto result = manager.terminate(103);
                     require(result.status == process::TerminateStatus::Failed, result.message);
                     require(!result.ok(), "failed is not ok");
                   }});

  tests.push_back({"process_cancelled_termination", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     backend->add(104, {.name = "slow", .window = true, .honours_close = false});
                     auto timings = fast_timings();
                     timings.graceful_window = std::chrono::seconds(5);
                     process::ProcessManager manager(backend, timings);
                     common::CancellationSource source;
                     std::thread canceller([&source] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(30));
                       source.cancel();
                     });
                     const auto result = manager.terminate(104, source.token());
                     canceller.join();
                     require(result.status == process::TerminateStatus::Cancelled, result.message);
                     require(backend->kill_requests == 0, "cancel stops before the kill");
                   }});

  tests.push_back({"process_list_sorted_by_name_then_pid", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     backend->add(30, {.name = "b"});
                     backend->add(20, {.name = "a"});
                     backend->add(10, {.name = "b"});
                     process::ProcessManager manager(backend, fast_timings());
                     const auto list = manager.list_running();
                     require(list.size() == 3, "three entries");
                     require(list[0].pid == 20 && list[1].pid == 10 && list[2].pid == 30,
                             "sorted order");
                   }});

  tests.push_back({"process_launch_passes_tokenized_argv", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     process::ProcessManager manager(backend, fast_timings());
                     const auto launched =
                         manager.launch("/usr/bin/app", "--name \"two words\" x", std::nullopt);
                     require(launched.ok(), launched.error());
                     require(launched.value().pid == 4242, "pid from backend");
                     require(backend->last_argv ==
                                 std::vector<std::string>{"/usr/bin/app", "--name", "two words", "x"},
                             "argv");
                   }});

  tests.push_back({"process_launch_rejects_missing_working_directory", [] {
                     auto backend = std::make_shared<FakeProcessBackend>();
                     process::ProcessManager manager(backend, fast_timings());
                     const auto launched = manager.launch("/usr/bin/app", "",
                                                          std::filesystem::path("/no/such/dir"));
                     require(!launched.ok() && launched.code() == common::ErrorCode::Validation,
                             "validation error");
                   }});

  tests.push_back({"process_tokenize_arguments", [] {
                     using V = std::vector<std::string>;
                     require(process::tokenize_arguments("  a  b ") == V{"a", "b"}, "whitespace");
                     require(process::tokenize_arguments("'a b' \"c \\\" d\"") ==
                                 V{"a b", "c \" d"},
                             "quotes");
                     require(process::tokenize_arguments("a\\ b") == V{"a b"}, "escaped space");
                     require(process::tokenize_arguments("\"\"") == V{""}, "empty quoted token");
                     require(process::tokenize_arguments("").empty(), "empty input");
                   }});

  tests.push_back({"process_resolve_path", [] {
                     hostgate::testing::TempWorkspace ws;
                     const auto script = ws.create_file("tool.sh", "#!/bin/sh\n");
                     hostgate::testing::EnvGuard path("PATH", ws.path().string());
                     const auto by_suffix = process::ProcessManager::resolve_path("tool");
                     require(by_suffix.has_value(), "suffix search");
                     require(by_suffix->filename() == "tool.sh", "found the .sh file");
                     require(process::ProcessManager::resolve_path(script.string()).has_value(),
                             "direct path");
                     require(!process::ProcessManager::resolve_path("no-such-app").has_value(),
                             "missing");
                     require(!process::ProcessManager::resolve_path("  ").has_value(), "blank");
                   }});

  tests.push_back({"process_resolve_path_relative_with_directory", [] {
                     hostgate::testing::TempWorkspace ws;
                     ws.create_file("tools/run.sh", "#!/bin/sh\n");
                     hostgate::testing::EnvGuard path("PATH", ws.path().string());
                     const auto found = process::ProcessManager::resolve_path("tools/run");
                     require(found.has_value(), "relative name with a directory is searched");
                     require(found->filename() == "run.sh", found->string());
                     require(found->is_absolute(), "resolved path is absolute");
                     require(!process::ProcessManager::resolve_path(
                                  (ws.path() / "tools" / "run").string())
                                  .has_value(),
                             "absolute path is not searched with suffixes");
                   }});

  tests.push_back({"process_posix_launch_and_terminate", [] {
                     process::ProcessManager manager(process::make_posix_backend(), fast_timings());
                     const auto launched =
                         manager.launch("/bin/sh", "-c \"exec sleep 30\"", std::nullopt);
                     require(launched.ok(), launched.error());
                     const auto result = manager.terminate(launched.value().pid);
                     require(result.ok(), result.message);
                   }});

  tests.push_back({"process_posix_exited_child_is_reaped", [] {
                     process::ProcessManager manager(process::make_posix_backend(), fast_timings());
                     const auto launched = manager.launch("/bin/sleep", "0.3", std::nullopt);
                     require(launched.ok(), launched.error());
                     const auto stat = std::filesystem::path("/proc") /
                                       std::to_string(launched.value().pid) / "stat";
                     // A zombie keeps its /proc entry until its parent waits on it.
                     bool reaped = false;
                     for (int i = 0; i < 40 && !reaped; ++i) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(100));
                       reaped = !std::filesystem::exists(stat);
                     }
                     require(reaped, "child exited and was reaped");
                   }});

  tests.push_back({"process_posix_exit_code_reported_once", [] {
                     const auto backend = process::make_posix_backend();
                     const auto spawned = backend->spawn(
                         "/bin/sh", std::vector<std::string>{"sh", "-c", "exit 3"}, std::nullopt);
                     require(spawned.ok(), spawned.error());
                     std::optional<int> code;
                     for (int i = 0; i < 40 && !code.has_value(); ++i) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(100));
                       code = backend->poll_exit(spawned.value());
                     }
                     require(code.has_value() && *code == 3, "exit code 3");
                     require(!backend->poll_exit(spawned.value()).has_value(),
                             "exit code is consumed by the first poll");
                     require(!backend->is_alive(spawned.value()), "not alive after exit");
                   }});

  tests.push_back({"process_posix_crash_reported", [] {
                     const auto false_bin = process::ProcessManager::resolve_path("false");
                     require(false_bin.has_value(), "false must be on PATH");
                     auto timings = fast_timings();
                     timings.crash_check = std::chrono::milliseconds(500);
                     process::ProcessManager manager(process::make_posix_backend(), timings);
                     const auto launched = manager.launch(*false_bin, "", std::nullopt);
                     require(!launched.ok(), "false exits non-zero");
                     require(launched.error().find("exited abnormally") != std::string::npos,
                             launched.error());
                   }});
}
