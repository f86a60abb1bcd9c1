#pragma once

#include "hostgate/common/cancellation.hpp"
#include "hostgate/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace hostgate::tools {

/// Untyped argument value. std::monostate is JSON null.
using ToolValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using ToolArgs = std::unordered_map<std::string, ToolValue>;

enum class ParamType { String, Integer, Number, Boolean };

/// "a string", "an integer", ... as used in validation messages.
[[nodiscard]] std::string_view param_type_phrase(ParamType type);
/// JSON-schema type name.
[[nodiscard]] std::string_view param_type_name(ParamType type);
[[nodiscard]] std::optional<ParamType> param_type_from_name(std::string_view name);

struct ParamSpec {
  std::string name;
  ParamType type = ParamType::String;
  bool required = false;
  std::string description;
};

/// Outcome envelope of one call. Exactly one of output/error is meaningful, selected by success.
struct ToolResult {
  bool success = true;
  std::string output;
  std::string error;
  common::ErrorCode kind = common::ErrorCode::None;
  bool truncated = false;
  std::unordered_map<std::string, std::string> metadata;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] static ToolResult ok(std::string output);
  [[nodiscard]] static ToolResult fail(std::string error,
                                       common::ErrorCode kind = common::ErrorCode::Faulted);

  [[nodiscard]] bool cancelled() const { return kind == common::ErrorCode::Cancelled; }
  [[nodiscard]] bool timed_out() const { return kind == common::ErrorCode::Timeout; }
  [[nodiscard]] const std::string &text() const { return success ? output : error; }
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::vector<ParamSpec> parameters;
  std::string parameters_json;
  bool safe = false;
  std::string group;
};

struct ToolContext {
  std::string call_id;
  /// Fires on caller cancellation and on timeout. Long-running handlers poll it.
  common::CancellationToken cancel;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::vector<ParamSpec> parameters() const = 0;
  /// Defaults to a JSON schema derived from parameters().
  [[nodiscard]] virtual std::string parameters_schema() const;
  /// A failed Result is an operational fault. Classified refusals (security, not found, ...)
  /// come back as a ToolResult with the matching kind.
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] virtual bool is_safe() const = 0;
  [[nodiscard]] virtual std::string_view group() const = 0;

  [[nodiscard]] ToolSpec spec() const;
};

[[nodiscard]] bool value_matches(const ToolValue &value, ParamType type);

[[nodiscard]] std::optional<std::string> get_string(const ToolArgs &args, const std::string &key);
[[nodiscard]] std::optional<std::int64_t> get_int(const ToolArgs &args, const std::string &key);
[[nodiscard]] bool get_bool(const ToolArgs &args, const std::string &key, bool fallback);

[[nodiscard]] std::string tool_value_to_json(const ToolValue &value);
[[nodiscard]] std::string tool_args_to_json(const ToolArgs &args);
/// Top-level members of a JSON object. Nested objects and arrays arrive as raw JSON strings.
[[nodiscard]] common::Result<ToolArgs> parse_tool_args(const std::string &json);

[[nodiscard]] std::string params_to_schema(const std::vector<ParamSpec> &params);
/// Reads `required` and `properties.<name>.type`; unknown types become strings.
[[nodiscard]] std::vector<ParamSpec> params_from_schema(const std::string &schema_json);

} // namespace hostgate::tools
