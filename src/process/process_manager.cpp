#include "hostgate/process/process_manager.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/observability/global.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include <csignal>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostgate::process {

namespace {

constexpr std::array<std::string_view, 33> kProtectedProcesses = {
    // linux session and display stack
    "systemd", "init", "kthreadd", "systemd-logind", "systemd-journald", "dbus-daemon",
    "dbus-broker", "login", "gdm", "gdm3", "sddm", "lightdm", "xorg", "xwayland",
    "gnome-shell", "kwin_x11", "kwin_wayland", "plasmashell", "sshd",
    // windows core services
    "system", "registry", "smss", "csrss", "wininit", "services", "lsass", "svchost",
    "explorer", "winlogon", "fontdrvhost", "dwm", "memory compression", "secure system"};

constexpr std::array<std::string_view, 4> kPathSuffixes = {"", ".sh", ".py", ".AppImage"};

std::filesystem::path proc_path(const std::int64_t pid, const char *entry) {
  return std::filesystem::path("/proc") / std::to_string(pid) / entry;
}

std::optional<std::string> read_proc_file(const std::int64_t pid, const char *entry) {
  std::ifstream in(proc_path(pid, entry), std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

/// Third field of /proc/<pid>/stat. The command name is parenthesised and may hold spaces.
char proc_state(const std::int64_t pid) {
  const auto stat = read_proc_file(pid, "stat");
  if (!stat.has_value()) {
    return '\0';
  }
  const auto paren = stat->rfind(')');
  if (paren == std::string::npos || paren + 2 >= stat->size()) {
    return '\0';
  }
  return (*stat)[paren + 2];
}

bool is_existing_file(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

int decode_wait_status(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

constexpr std::size_t kMaxUnclaimedExits = 256;
constexpr std::chrono::milliseconds kReapInterval{200};

class PosixProcessBackend final : public IProcessBackend {
public:
  PosixProcessBackend() = default;
  PosixProcessBackend(const PosixProcessBackend &) = delete;
  PosixProcessBackend &operator=(const PosixProcessBackend &) = delete;

  ~PosixProcessBackend() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    wake_.notify_all();
    if (reaper_.joinable()) {
      reaper_.join();
    }
  }

  common::Result<std::int64_t>
  spawn(const std::filesystem::path &executable, const std::vector<std::string> &argv,
        const std::optional<std::filesystem::path> &working_directory) override {
    int pipefd[2] = {-1, -1};
    if (pipe2(pipefd, O_CLOEXEC) != 0) {
      return common::Result<std::int64_t>::failure(std::string("Failed to create pipe: ") +
                                                    std::strerror(errno));
    }

    std::vector<char *> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      cargs.push_back(const_cast<char *>(arg.c_str()));
    }
    cargs.push_back(nullptr);
    const std::string exe = executable.string();
    const std::string cwd = working_directory.has_value() ? working_directory->string() : "";

    const pid_t pid = fork();
    if (pid < 0) {
      close(pipefd[0]);
      close(pipefd[1]);
      return common::Result<std::int64_t>::failure(std::string("Failed to fork: ") +
                                                   std::strerror(errno));
    }

    if (pid == 0) {
      close(pipefd[0]);
      setsid();
      const int devnull = open("/dev/null", O_RDWR);
      if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(devnull, STDOUT_FILENO);
        dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) {
          close(devnull);
        }
      }
      if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
        const int err = errno;
        (void)!write(pipefd[1], &err, sizeof(err));
        _exit(127);
      }
      execv(exe.c_str(), cargs.data());
      const int err = errno;
      (void)!write(pipefd[1], &err, sizeof(err));
      _exit(127);
    }

    close(pipefd[1]);
    int child_errno = 0;
    ssize_t got = 0;
    do {
      got = read(pipefd[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    close(pipefd[0]);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
      int status = 0;
      (void)waitpid(pid, &status, 0);
      return common::Result<std::int64_t>::failure("Failed to start '" + exe +
                                                   "': " + std::strerror(child_errno));
    }
    track_child(static_cast<std::int64_t>(pid));
    return common::Result<std::int64_t>::success(static_cast<std::int64_t>(pid));
  }

  std::optional<int> poll_exit(const std::int64_t pid) override {
    reap(pid);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find_if(exited_.begin(), exited_.end(),
                                 [pid](const auto &entry) { return entry.first == pid; });
    if (it == exited_.end()) {
      return std::nullopt;
    }
    const int code = it->second;
    exited_.erase(it);
    return code;
  }

  std::optional<std::string> name_of(const std::int64_t pid) override {
    auto comm = read_proc_file(pid, "comm");
    if (!comm.has_value()) {
      return std::nullopt;
    }
    return common::trim(*comm);
  }

  bool has_main_window(const std::int64_t pid) override {
    const auto env_block = read_proc_file(pid, "environ");
    if (!env_block.has_value()) {
      return false;
    }
    for (const auto &entry : common::split(*env_block, '\0')) {
      if ((common::starts_with(entry, "DISPLAY=") && entry.size() > 8) ||
          (common::starts_with(entry, "WAYLAND_DISPLAY=") && entry.size() > 16)) {
        return true;
      }
    }
    return false;
  }

  common::Status request_close(const std::int64_t pid) override {
    return send_signal(pid, SIGTERM);
  }

  common::Status force_kill(const std::int64_t pid) override { return send_signal(pid, SIGKILL); }

  bool is_alive(const std::int64_t pid) override {
    reap(pid);
    if (kill(static_cast<pid_t>(pid), 0) != 0 && errno != EPERM) {
      return false;
    }
    return proc_state(pid) != 'Z';
  }

  std::vector<ProcessInfo> list() override {
    std::vector<ProcessInfo> processes;
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc", ec);
    if (ec) {
      return processes;
    }
    const long page_size = sysconf(_SC_PAGESIZE);

    for (const auto &entry : it) {
      const std::string dir_name = entry.path().filename().string();
      if (dir_name.empty() ||
          !std::all_of(dir_name.begin(), dir_name.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; })) {
        continue;
      }

      ProcessInfo info;
      info.pid = std::strtoll(dir_name.c_str(), nullptr, 10);
      const auto name = name_of(info.pid);
      if (!name.has_value() || name->empty()) {
        continue;
      }
      info.name = *name;

      if (const auto statm = read_proc_file(info.pid, "statm"); statm.has_value()) {
        std::istringstream fields(*statm);
        unsigned long long size_pages = 0;
        unsigned long long resident_pages = 0;
        if (fields >> size_pages >> resident_pages && page_size > 0) {
          info.memory_mb = static_cast<double>(resident_pages) *
                           static_cast<double>(page_size) / (1024.0 * 1024.0);
        }
      }
      processes.push_back(std::move(info));
    }
    return processes;
  }

private:
  common::Status send_signal(const std::int64_t pid, const int signo) {
    if (kill(static_cast<pid_t>(pid), signo) == 0) {
      return common::Status::success();
    }
    if (errno == ESRCH) {
      return common::Status::error("No such process: " + std::to_string(pid),
                                   common::ErrorCode::NotFound);
    }
    return common::Status::error("Failed to signal pid " + std::to_string(pid) + ": " +
                                 std::strerror(errno));
  }

  // Only our own children can be reaped; for anything else waitpid fails with ECHILD.
  void reap(const std::int64_t pid) {
    int status = 0;
    const pid_t done = waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
    if (done == static_cast<pid_t>(pid)) {
      std::lock_guard<std::mutex> lock(mutex_);
      children_.erase(pid);
      record_exit(pid, decode_wait_status(status));
    }
  }

  void track_child(const std::int64_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    // A recycled pid must not report the exit code of its predecessor.
    exited_.erase(std::remove_if(exited_.begin(), exited_.end(),
                                 [pid](const auto &entry) { return entry.first == pid; }),
                  exited_.end());
    children_.insert(pid);
    if (!reaper_.joinable()) {
      reaper_ = std::thread([this] { reap_loop(); });
    }
  }

  // Caller holds mutex_. Exit codes nobody asks for are dropped oldest first.
  void record_exit(const std::int64_t pid, const int code) {
    exited_.emplace_back(pid, code);
    if (exited_.size() > kMaxUnclaimedExits) {
      exited_.erase(exited_.begin());
    }
  }

  // Launched applications exit on their own; each one is reaped here or it stays a zombie.
  void reap_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
      wake_.wait_for(lock, kReapInterval, [this] { return stopping_; });
      if (stopping_) {
        break;
      }
      const std::vector<std::int64_t> pending(children_.begin(), children_.end());
      for (const auto pid : pending) {
        int status = 0;
        const pid_t done = waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
        if (done == static_cast<pid_t>(pid)) {
          children_.erase(pid);
          record_exit(pid, decode_wait_status(status));
        } else if (done < 0 && errno == ECHILD) {
          children_.erase(pid);
        }
      }
    }
  }

  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_ = false;
  std::unordered_set<std::int64_t> children_;
  std::vector<std::pair<std::int64_t, int>> exited_;
  std::thread reaper_;
};

} // namespace

std::string_view terminate_status_name(const TerminateStatus status) {
  switch (status) {
  case TerminateStatus::Graceful:
    return "graceful";
  case TerminateStatus::Forced:
    return "forced";
  case TerminateStatus::InvalidPid:
    return "invalid_pid";
  case TerminateStatus::NotFound:
    return "not_found";
  case TerminateStatus::Protected:
    return "protected";
  case TerminateStatus::Cancelled:
    return "cancelled";
  case TerminateStatus::Failed:
    return "failed";
  }
  return "failed";
}

std::shared_ptr<IProcessBackend> make_posix_backend() {
  return std::make_shared<PosixProcessBackend>();
}

std::vector<std::string> tokenize_arguments(const std::string &arguments) {
  std::vector<std::string> tokens;
  std::string current;
  bool in_token = false;
  char quote = '\0';

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const char ch = arguments[i];
    if (quote != '\0') {
      if (ch == quote) {
        quote = '\0';
      } else if (ch == '\\' && quote == '"' && i + 1 < arguments.size() &&
                 (arguments[i + 1] == '"' || arguments[i + 1] == '\\')) {
        current.push_back(arguments[++i]);
      } else {
        current.push_back(ch);
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      in_token = true;
      continue;
    }
    if (ch == '\\' && i + 1 < arguments.size()) {
      current.push_back(arguments[++i]);
      in_token = true;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (in_token) {
        tokens.push_back(std::move(current));
        current.clear();
        in_token = false;
      }
      continue;
    }
    current.push_back(ch);
    in_token = true;
  }
  if (in_token) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

bool is_protected_process(const std::string_view name) {
  const std::string lowered = common::to_lower(common::trim(std::string(name)));
  return std::find(kProtectedProcesses.begin(), kProtectedProcesses.end(), lowered) !=
         kProtectedProcesses.end();
}

ProcessManager::ProcessManager(std::shared_ptr<IProcessBackend> backend,
                               const TerminationTimings timings)
    : backend_(std::move(backend)), timings_(timings) {}

std::optional<std::filesystem::path> ProcessManager::resolve_path(const std::string &candidate) {
  const std::string trimmed = common::trim(candidate);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  const std::filesystem::path direct(common::expand_path(trimmed));
  if (is_existing_file(direct)) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(direct, ec);
    return ec ? direct : absolute.lexically_normal();
  }
  if (direct.is_absolute()) {
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return std::nullopt;
  }
  for (const auto &dir : common::split(path_env, ':')) {
    if (common::trim(dir).empty()) {
      continue;
    }
    for (const auto suffix : kPathSuffixes) {
      const std::filesystem::path full = std::filesystem::path(dir) / (trimmed + std::string(suffix));
      if (is_existing_file(full)) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(full, ec);
        return ec ? full : absolute.lexically_normal();
      }
    }
  }
  return std::nullopt;
}

common::Result<LaunchedProcess>
ProcessManager::launch(const std::filesystem::path &executable, const std::string &arguments,
                       const std::optional<std::filesystem::path> &working_directory,
                       const common::CancellationToken &cancel) {
  using R = common::Result<LaunchedProcess>;
  if (cancel.is_cancelled()) {
    return R::failure("Launch cancelled", common::ErrorCode::Cancelled);
  }
  if (working_directory.has_value()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(*working_directory, ec)) {
      return R::failure("Working directory does not exist: " + working_directory->string(),
                        common::ErrorCode::Validation);
    }
  }

  std::vector<std::string> argv;
  argv.push_back(executable.string());
  auto tokens = tokenize_arguments(arguments);
  std::move(tokens.begin(), tokens.end(), std::back_inserter(argv));

  const auto spawned = backend_->spawn(executable, argv, working_directory);
  if (!spawned.ok()) {
    observability::record_process("failed", 0, executable.filename().string(), spawned.error());
    return R::failure(spawned.status());
  }
  const std::int64_t pid = spawned.value();

  if (!common::sleep_cancellable(timings_.crash_check, cancel)) {
    return R::failure("Launch cancelled after start (PID: " + std::to_string(pid) + ")",
                      common::ErrorCode::Cancelled);
  }

  if (const auto code = backend_->poll_exit(pid); code.has_value() && *code != 0) {
    observability::record_process("failed", pid, executable.filename().string(),
                                  "exit code " + std::to_string(*code));
    return R::failure("Application exited abnormally (Exit Code: " + std::to_string(*code) + ")");
  }

  observability::record_process("launched", pid, executable.filename().string());
  return R::success(LaunchedProcess{.pid = pid, .path = executable});
}

ProcessManager::WaitOutcome ProcessManager::wait_for_exit(const std::int64_t pid,
                                                          const std::chrono::milliseconds window,
                                                          const common::CancellationToken &cancel) {
  const auto deadline = std::chrono::steady_clock::now() + window;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel.is_cancelled()) {
      return WaitOutcome::Cancelled;
    }
    if (!backend_->is_alive(pid)) {
      return WaitOutcome::Exited;
    }
    if (!common::sleep_cancellable(timings_.poll_interval, cancel)) {
      return WaitOutcome::Cancelled;
    }
  }
  return backend_->is_alive(pid) ? WaitOutcome::TimedOut : WaitOutcome::Exited;
}

TerminationResult ProcessManager::terminate(const std::int64_t pid,
                                            const common::CancellationToken &cancel) {
  const std::string pid_text = std::to_string(pid);
  if (pid <= 0) {
    return {TerminateStatus::InvalidPid, "", "process_id must be a positive integer"};
  }

  const auto name = backend_->name_of(pid);
  if (!name.has_value()) {
    return {TerminateStatus::NotFound, "", "Process ID " + pid_text + " was not found"};
  }

  if (is_protected_process(*name)) {
    observability::record_process("protected", pid, *name);
    return {TerminateStatus::Protected, *name,
            "System process '" + *name + "' (PID: " + pid_text + ") cannot be terminated"};
  }

  const auto cancelled = [&]() -> TerminationResult {
    return {TerminateStatus::Cancelled, *name,
            "Termination of '" + *name + "' (PID: " + pid_text + ") was cancelled"};
  };

  if (backend_->has_main_window(pid)) {
    if (const auto closed = backend_->request_close(pid); closed.ok()) {
      const auto outcome = wait_for_exit(pid, timings_.graceful_window, cancel);
      if (outcome == WaitOutcome::Cancelled) {
        return cancelled();
      }
      if (outcome == WaitOutcome::Exited) {
        observability::record_process("terminated", pid, *name, "graceful");
        return {TerminateStatus::Graceful, *name,
                "Application '" + *name + "' (PID: " + pid_text + ") closed gracefully"};
      }
    } else if (closed.code() == common::ErrorCode::NotFound) {
      return {TerminateStatus::Graceful, *name,
              "Application '" + *name + "' (PID: " + pid_text + ") exited before close"};
    }
  }

  if (cancel.is_cancelled()) {
    return cancelled();
  }

  if (const auto killed = backend_->force_kill(pid); !killed.ok()) {
    if (killed.code() != common::ErrorCode::NotFound) {
      observability::record_process("failed", pid, *name, killed.error());
      return {TerminateStatus::Failed, *name, killed.error()};
    }
  }

  const auto outcome = wait_for_exit(pid, timings_.kill_window, cancel);
  if (outcome == WaitOutcome::Cancelled) {
    return cancelled();
  }
  if (outcome == WaitOutcome::Exited) {
    observability::record_process("terminated", pid, *name, "forced");
    return {TerminateStatus::Forced, *name,
            "Application '" + *name + "' (PID: " + pid_text + ") was force-terminated"};
  }

  observability::record_process("failed", pid, *name, "still running after kill");
  return {TerminateStatus::Failed, *name,
          "Failed to terminate '" + *name + "' (PID: " + pid_text + ")"};
}

std::vector<ProcessInfo> ProcessManager::list_running() const {
  auto processes = backend_->list();
  std::sort(processes.begin(), processes.end(), [](const ProcessInfo &a, const ProcessInfo &b) {
    if (a.name != b.name) {
      return a.name < b.name;
    }
    return a.pid < b.pid;
  });
  return processes;
}

} // namespace hostgate::process
