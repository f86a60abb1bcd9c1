#include "test_framework.hpp"

#include "hostgate/common/cancellation.hpp"
#include "hostgate/tools/dispatcher.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

namespace {

namespace common = hostgate::common;
namespace tools = hostgate::tools;

using Handler =
    std::function<common::Result<tools::ToolResult>(const tools::ToolArgs &, const tools::ToolContext &)>;

class LambdaTool final : public tools::ITool {
public:
  LambdaTool(std::string name, std::vector<tools::ParamSpec> params, Handler handler)
      : name_(std::move(name)), params_(std::move(params)), handler_(std::move(handler)) {}

  std::string_view name() const override { return name_; }
  std::string_view description() const override { return "test tool"; }
  std::vector<tools::ParamSpec> parameters() const override { return params_; }
  common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                            const tools::ToolContext &ctx) override {
    return handler_(args, ctx);
  }
  bool is_safe() const override { return true; }
  std::string_view group() const override { return "test"; }

private:
  std::string name_;
  std::vector<tools::ParamSpec> params_;
  Handler handler_;
};

std::shared_ptr<tools::ITool> echo_tool() {
  return std::make_shared<LambdaTool>(
      "echo",
      std::vector<tools::ParamSpec>{
          {.name = "text", .type = tools::ParamType::String, .required = true},
          {.name = "count", .type = tools::ParamType::Integer}},
      [](const tools::ToolArgs &args, const tools::ToolContext &) {
        return common::Result<tools::ToolResult>::success(
            tools::ToolResult::ok(tools::get_string(args, "text").value_or("")));
      });
}

/// Waits on the context token, reporting whether it fired.
std::shared_ptr<tools::ITool> blocking_tool(std::shared_ptr<std::atomic_bool> saw_cancel) {
  return std::make_shared<LambdaTool>(
      "block", std::vector<tools::ParamSpec>{},
      [saw_cancel](const tools::ToolArgs &, const tools::ToolContext &ctx) {
        if (!common::sleep_cancellable(std::chrono::seconds(5), ctx.cancel)) {
          saw_cancel->store(true);
          return common::Result<tools::ToolResult>::success(
              tools::ToolResult::fail("stopped", common::ErrorCode::Cancelled));
        }
        return common::Result<tools::ToolResult>::success(tools::ToolResult::ok("done"));
      });
}

bool eventually(const std::function<bool()> &predicate) {
  for (int i = 0; i < 200; ++i) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}

} // namespace

void register_tools_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;

  tests.push_back({"dispatcher_executes_registered_tool", [] {
                     tools::Dispatcher dispatcher;
                     require(dispatcher.register_tool(echo_tool()).ok(), "register");
                     const auto result = dispatcher.execute("ECHO", {{"text", std::string("hi")}});
                     require(result.success, result.error);
                     require(result.output == "hi", "output");
                     require(result.kind == common::ErrorCode::None, "kind none on success");
                   }});

  tests.push_back({"dispatcher_unknown_tool", [] {
                     tools::Dispatcher dispatcher;
                     const auto result = dispatcher.execute("nope", {});
                     require(!result.success && result.kind == common::ErrorCode::NotFound,
                             "not found kind");
                     require(result.error == "Tool not found: nope", result.error);
                   }});

  tests.push_back({"dispatcher_validates_arguments", [] {
                     tools::Dispatcher dispatcher;
                     require(dispatcher.register_tool(echo_tool()).ok(), "register");

                     const auto missing = dispatcher.execute("echo", {});
                     require(missing.kind == common::ErrorCode::Validation, "missing kind");
                     require(missing.error == "Missing required parameter: text", missing.error);

                     const auto null_value =
                         dispatcher.execute("echo", {{"text", std::monostate{}}});
                     require(null_value.error == "Missing required parameter: text",
                             "null counts as missing");

                     const auto wrong = dispatcher.execute(
                         "echo", {{"text", std::string("x")}, {"count", std::string("3")}});
                     require(wrong.error == "Parameter 'count' must be an integer", wrong.error);

                     const auto integral_double = dispatcher.execute(
                         "echo", {{"text", std::string("x")}, {"count", 3.0}});
                     require(integral_double.success, "3.0 is an integer");
                   }});

  tests.push_back({"dispatcher_rejects_bad_registrations", [] {
                     tools::Dispatcher dispatcher;
                     require(dispatcher.register_tool(echo_tool()).ok(), "first");
                     const auto duplicate = dispatcher.register_tool(echo_tool());
                     require(!duplicate.ok() && duplicate.code() == common::ErrorCode::Validation,
                             "duplicate rejected");
                     const auto reserved = dispatcher.register_tool(std::make_shared<LambdaTool>(
                         "extension_sneaky", std::vector<tools::ParamSpec>{},
                         [](const tools::ToolArgs &, const tools::ToolContext &) {
                           return common::Result<tools::ToolResult>::success(
                               tools::ToolResult::ok(""));
                         }));
                     require(!reserved.ok(), "reserved prefix rejected");
                     require(!dispatcher.register_tool(nullptr).ok(), "null rejected");
                     require(dispatcher.all_specs().size() == 1, "one tool registered");
                   }});

  tests.push_back({"dispatcher_timeout_cancels_handler", [] {
                     tools::Dispatcher dispatcher;
                     auto saw_cancel = std::make_shared<std::atomic_bool>(false);
                     require(dispatcher.register_tool(blocking_tool(saw_cancel)).ok(), "register");
                     const auto result =
                         dispatcher.execute("block", {}, std::chrono::milliseconds(50));
                     require(result.kind == common::ErrorCode::Timeout, "timeout kind");
                     require(result.timed_out() && !result.cancelled(), "distinct from cancel");
                     require(result.error == "Tool 'block' timed out after 50 ms", result.error);
                     require(eventually([&] { return saw_cancel->load(); }),
                             "handler observes the token");
                   }});

  tests.push_back({"dispatcher_caller_cancel", [] {
                     tools::Dispatcher dispatcher;
                     auto saw_cancel = std::make_shared<std::atomic_bool>(false);
                     require(dispatcher.register_tool(blocking_tool(saw_cancel)).ok(), "register");
                     common::CancellationSource source;
                     auto pending = dispatcher.execute_async("block", {}, std::nullopt,
                                                             source.token());
                     std::this_thread::sleep_for(std::chrono::milliseconds(40));
                     source.cancel();
                     const auto result = pending.get();
                     require(result.cancelled() && !result.timed_out(), "cancelled kind");
                     require(result.error == "Tool call cancelled: block", result.error);
                     require(eventually([&] { return saw_cancel->load(); }),
                             "handler observes the token");
                   }});

  tests.push_back({"dispatcher_precancelled_call_never_runs", [] {
                     tools::Dispatcher dispatcher;
                     std::atomic_bool ran{false};
                     require(dispatcher
                                 .register_tool(std::make_shared<LambdaTool>(
                                     "flag", std::vector<tools::ParamSpec>{},
                                     [&ran](const tools::ToolArgs &, const tools::ToolContext &) {
                                       ran.store(true);
                                       return common::Result<tools::ToolResult>::success(
                                           tools::ToolResult::ok(""));
                                     }))
                                 .ok(),
                             "register");
                     common::CancellationSource source;
                     source.cancel();
                     const auto result = dispatcher.execute("flag", {}, std::nullopt, source.token());
                     require(result.cancelled(), "cancelled");
                     require(!ran.load(), "handler skipped");
                   }});

  tests.push_back({"dispatcher_faults_are_contained", [] {
                     tools::Dispatcher dispatcher;
                     require(dispatcher
                                 .register_tool(std::make_shared<LambdaTool>(
                                     "boom", std::vector<tools::ParamSpec>{},
                                     [](const tools::ToolArgs &,
                                        const tools::ToolContext &) -> common::Result<tools::ToolResult> {
                                       throw std::runtime_error("kaput");
                                     }))
                                 .ok(),
                             "register boom");
                     require(dispatcher
                                 .register_tool(std::make_shared<LambdaTool>(
                                     "broken", std::vector<tools::ParamSpec>{},
                                     [](const tools::ToolArgs &, const tools::ToolContext &) {
                                       return common::Result<tools::ToolResult>::failure(
                                           "disk on fire");
                                     }))
                                 .ok(),
                             "register broken");

                     const auto thrown = dispatcher.execute("boom", {});
                     require(thrown.kind == common::ErrorCode::Faulted, "faulted");
                     require(thrown.error == "Tool 'boom' threw: kaput", thrown.error);
                     const auto failed = dispatcher.execute("broken", {});
                     require(failed.kind == common::ErrorCode::Faulted &&
                                 failed.error == "disk on fire",
                             "operational fault");
                   }});

  tests.push_back({"dispatcher_normalizes_results", [] {
                     tools::Dispatcher dispatcher;
                     require(dispatcher
                                 .register_tool(std::make_shared<LambdaTool>(
                                     "sloppy", std::vector<tools::ParamSpec>{},
                                     [](const tools::ToolArgs &, const tools::ToolContext &) {
                                       tools::ToolResult result;
                                       result.success = false;
                                       result.output = "went wrong";
                                       return common::Result<tools::ToolResult>::success(result);
                                     }))
                                 .ok(),
                             "register");
                     const auto result = dispatcher.execute("sloppy", {});
                     require(!result.success && result.kind == common::ErrorCode::Faulted,
                             "failure without kind is a fault");
                     require(result.error == "went wrong" && result.output.empty(),
                             "message moved to error");
                   }});

  tests.push_back({"dispatcher_records_events", [] {
                     hostgate::testing::ObserverCapture capture;
                     tools::Dispatcher dispatcher;
                     require(dispatcher.register_tool(echo_tool()).ok(), "register");
                     static_cast<void>(dispatcher.execute("echo", {{"text", std::string("a")}}));
                     static_cast<void>(dispatcher.execute("missing", {}));
                     const auto calls =
                         capture.observer().events_of<hostgate::observability::ToolCallEvent>();
                     require(calls.size() == 2, "two tool calls recorded");
                     require(calls[0].success && calls[0].outcome == "completed", "first");
                     require(!calls[1].success && calls[1].outcome == "not_found", "second");
                   }});

  tests.push_back({"dispatcher_batch_keeps_order", [] {
                     tools::Dispatcher dispatcher(
                         tools::Dispatcher::Options{.default_timeout = std::chrono::seconds(5),
                                                    .max_concurrent_calls = 3});
                     require(dispatcher.register_tool(echo_tool()).ok(), "register");
                     std::vector<tools::ToolCallRequest> calls;
                     for (int i = 0; i < 10; ++i) {
                       calls.push_back({.id = "c" + std::to_string(i),
                                        .tool = i == 4 ? "missing" : "echo",
                                        .arguments = {{"text", std::to_string(i)}}});
                     }
                     const auto results = dispatcher.execute_batch(calls);
                     require(results.size() == 10, "one result per call");
                     for (int i = 0; i < 10; ++i) {
                       require(results[i].id == "c" + std::to_string(i), "id order");
                       if (i == 4) {
                         require(results[i].result.kind == common::ErrorCode::NotFound,
                                 "failed call isolated");
                       } else {
                         require(results[i].result.output == std::to_string(i), "output order");
                       }
                     }
                   }});

  tests.push_back({"parse_tool_args_types", [] {
                     const auto parsed = tools::parse_tool_args(
                         R"({"s":"x","i":42,"d":1.5,"b":true,"n":null,"o":{"k":1}})");
                     require(parsed.ok(), parsed.error());
                     const auto &args = parsed.value();
                     require(std::get<std::string>(args.at("s")) == "x", "string");
                     require(std::get<std::int64_t>(args.at("i")) == 42, "integer");
                     require(std::get<double>(args.at("d")) == 1.5, "double");
                     require(std::get<bool>(args.at("b")), "bool");
                     require(std::holds_alternative<std::monostate>(args.at("n")), "null");
                     require(std::get<std::string>(args.at("o")) == R"({"k":1})", "raw object");
                     require(!tools::parse_tool_args("[1,2]").ok(), "array rejected");
                     require(tools::parse_tool_args("  ").ok(), "blank is empty args");
                   }});

  tests.push_back({"schema_roundtrip_through_params", [] {
                     const std::vector<tools::ParamSpec> params = {
                         {.name = "path", .type = tools::ParamType::String, .required = true,
                          .description = "file \"path\""},
                         {.name = "limit", .type = tools::ParamType::Integer}};
                     const auto parsed = tools::params_from_schema(tools::params_to_schema(params));
                     require(parsed.size() == 2, "two params");
                     require(parsed[0].name == "limit" && parsed[0].type == tools::ParamType::Integer &&
                                 !parsed[0].required,
                             "limit");
                     require(parsed[1].name == "path" && parsed[1].required &&
                                 parsed[1].description == "file \"path\"",
                             "path");
                   }});
}
