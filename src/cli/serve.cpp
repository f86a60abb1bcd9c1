#include "hostgate/cli/serve.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/common/json_util.hpp"

#include <charconv>
#include <condition_variable>
#include <istream>
#include <mutex>
#include <ostream>
#include <thread>
#include <unordered_map>

namespace hostgate::cli {

namespace {

/// Shared between the reader loop and the request threads.
class ServeState {
public:
  ServeState(std::ostream &out, const std::size_t max_in_flight)
      : out_(out), max_running_(max_in_flight == 0 ? 1 : max_in_flight) {}

  void write_line(const std::string &line) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << line << "\n";
    out_.flush();
  }

  /// False when the id is already in flight.
  bool begin(const std::string &id, const common::CancellationSource &source) {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.emplace(id, source).second;
  }

  void end(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(id);
  }

  bool cancel(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = in_flight_.find(id);
    if (it == in_flight_.end()) {
      return false;
    }
    it->second.cancel();
    slot_released_.notify_all();
    return true;
  }

  /// Blocks until fewer than max_in_flight handlers run. False if `cancel` fires first.
  bool acquire_slot(const common::CancellationToken &cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_ >= max_running_) {
      if (cancel.is_cancelled()) {
        return false;
      }
      slot_released_.wait_for(lock, std::chrono::milliseconds(50));
    }
    ++running_;
    return true;
  }

  void release_slot() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
    }
    slot_released_.notify_one();
  }

private:
  std::ostream &out_;
  std::mutex out_mutex_;
  std::mutex mutex_;
  std::condition_variable slot_released_;
  std::unordered_map<std::string, common::CancellationSource> in_flight_;
  std::size_t running_ = 0;
  std::size_t max_running_;
};

std::optional<std::string> token_text(const common::JsonTypedMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  if (it->second.kind == common::JsonKind::String || it->second.kind == common::JsonKind::Number) {
    return it->second.text;
  }
  return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_timeout(const common::JsonTypedMap &fields) {
  const auto raw = token_text(fields, "timeout_ms");
  if (!raw.has_value()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto *first = raw->data();
  const auto *last = first + raw->size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || value <= 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(value);
}

} // namespace

RequestWorkers::~RequestWorkers() { join_all(); }

void RequestWorkers::spawn(std::function<void()> work) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([work = std::move(work), done]() {
    work();
    done->store(true);
  });
  workers_.push_back(Worker{std::move(thread), std::move(done)});
}

std::size_t RequestWorkers::reap_finished() {
  std::size_t joined = 0;
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
      ++joined;
    } else {
      ++it;
    }
  }
  return joined;
}

void RequestWorkers::join_all() {
  for (auto &worker : workers_) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  workers_.clear();
}

std::string format_response(const std::optional<std::string> &id,
                            const tools::ToolResult &result) {
  std::string line = "{\"id\":";
  line += id.has_value() ? "\"" + common::json_escape(*id) + "\"" : std::string("null");
  line += ",\"success\":";
  line += result.success ? "true" : "false";
  line += ",\"outcome\":\"" + std::string(common::error_code_name(result.kind)) + "\"";
  if (result.success) {
    line += ",\"output\":\"" + common::json_escape(result.output) + "\"";
  } else {
    line += ",\"error\":\"" + common::json_escape(result.error) + "\"";
  }
  if (result.truncated) {
    line += ",\"truncated\":true";
  }
  line += ",\"duration_ms\":" + std::to_string(result.duration.count()) + "}";
  return line;
}

int serve_ndjson(const tools::Dispatcher &dispatcher, std::istream &in, std::ostream &out) {
  ServeState state(out, dispatcher.options().max_concurrent_calls);
  RequestWorkers workers;
  std::size_t anonymous = 0;

  std::string line;
  while (std::getline(in, line)) {
    workers.reap_finished();
    line = common::trim(line);
    if (line.empty()) {
      continue;
    }
    if (line.front() != '{') {
      state.write_line(format_response(
          std::nullopt, tools::ToolResult::fail("Request must be a JSON object",
                                                common::ErrorCode::Validation)));
      continue;
    }

    const auto fields = common::json_parse_flat_typed(line);
    if (const auto cancel_id = token_text(fields, "cancel"); cancel_id.has_value()) {
      if (!state.cancel(*cancel_id)) {
        state.write_line(format_response(
            cancel_id, tools::ToolResult::fail("No in-flight request with id " + *cancel_id,
                                               common::ErrorCode::NotFound)));
      }
      continue;
    }

    const auto id = token_text(fields, "id");
    const auto tool = token_text(fields, "tool");
    if (!tool.has_value() || common::trim(*tool).empty()) {
      state.write_line(format_response(id, tools::ToolResult::fail("Request is missing \"tool\"",
                                                                   common::ErrorCode::Validation)));
      continue;
    }

    tools::ToolArgs args;
    if (const auto it = fields.find("arguments"); it != fields.end()) {
      auto parsed = tools::parse_tool_args(it->second.kind == common::JsonKind::Object
                                               ? it->second.text
                                               : std::string("not an object"));
      if (!parsed.ok()) {
        state.write_line(
            format_response(id, tools::ToolResult::fail(parsed.error(), parsed.code())));
        continue;
      }
      args = std::move(parsed.value());
    }

    const std::string key = id.value_or("#" + std::to_string(++anonymous));
    common::CancellationSource source;
    if (!state.begin(key, source)) {
      state.write_line(format_response(
          id, tools::ToolResult::fail("Request id " + key + " is already in flight",
                                      common::ErrorCode::Validation)));
      continue;
    }

    workers.spawn([&dispatcher, &state, id, key, tool = *tool, args = std::move(args),
                   timeout = parse_timeout(fields), token = source.token()]() {
      tools::ToolResult result;
      if (state.acquire_slot(token)) {
        result = dispatcher.execute(tool, args, timeout, token, key);
        state.release_slot();
      } else {
        result = tools::ToolResult::fail("Tool call cancelled: " + tool,
                                         common::ErrorCode::Cancelled);
      }
      state.end(key);
      state.write_line(format_response(id, result));
    });
  }

  workers.join_all();
  return 0;
}

} // namespace hostgate::cli
