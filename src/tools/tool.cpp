#include "hostgate/tools/tool.hpp"

#include "hostgate/common/json_util.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace hostgate::tools {

namespace {

bool looks_integral(const std::string &text) {
  return text.find_first_of(".eE") == std::string::npos;
}

} // namespace

std::string_view param_type_phrase(const ParamType type) {
  switch (type) {
  case ParamType::String:
    return "a string";
  case ParamType::Integer:
    return "an integer";
  case ParamType::Number:
    return "a number";
  case ParamType::Boolean:
    return "a boolean";
  }
  return "a string";
}

std::string_view param_type_name(const ParamType type) {
  switch (type) {
  case ParamType::String:
    return "string";
  case ParamType::Integer:
    return "integer";
  case ParamType::Number:
    return "number";
  case ParamType::Boolean:
    return "boolean";
  }
  return "string";
}

std::optional<ParamType> param_type_from_name(const std::string_view name) {
  if (name == "string") {
    return ParamType::String;
  }
  if (name == "integer") {
    return ParamType::Integer;
  }
  if (name == "number") {
    return ParamType::Number;
  }
  if (name == "boolean") {
    return ParamType::Boolean;
  }
  return std::nullopt;
}

ToolResult ToolResult::ok(std::string output) {
  ToolResult result;
  result.success = true;
  result.output = std::move(output);
  return result;
}

ToolResult ToolResult::fail(std::string error, const common::ErrorCode kind) {
  ToolResult result;
  result.success = false;
  result.error = std::move(error);
  result.kind = kind == common::ErrorCode::None ? common::ErrorCode::Faulted : kind;
  return result;
}

std::string ITool::parameters_schema() const { return params_to_schema(parameters()); }

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters = parameters(),
                  .parameters_json = parameters_schema(),
                  .safe = is_safe(),
                  .group = std::string(group())};
}

bool value_matches(const ToolValue &value, const ParamType type) {
  switch (type) {
  case ParamType::String:
    return std::holds_alternative<std::string>(value);
  case ParamType::Integer:
    if (std::holds_alternative<std::int64_t>(value)) {
      return true;
    }
    if (const auto *d = std::get_if<double>(&value)) {
      return std::isfinite(*d) && std::trunc(*d) == *d;
    }
    return false;
  case ParamType::Number:
    return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
  case ParamType::Boolean:
    return std::holds_alternative<bool>(value);
  }
  return false;
}

std::optional<std::string> get_string(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  if (it == args.end()) {
    return std::nullopt;
  }
  if (const auto *s = std::get_if<std::string>(&it->second)) {
    return *s;
  }
  return std::nullopt;
}

std::optional<std::int64_t> get_int(const ToolArgs &args, const std::string &key) {
  const auto it = args.find(key);
  if (it == args.end()) {
    return std::nullopt;
  }
  if (const auto *i = std::get_if<std::int64_t>(&it->second)) {
    return *i;
  }
  if (const auto *d = std::get_if<double>(&it->second);
      d != nullptr && std::isfinite(*d) && std::trunc(*d) == *d) {
    return static_cast<std::int64_t>(*d);
  }
  return std::nullopt;
}

bool get_bool(const ToolArgs &args, const std::string &key, const bool fallback) {
  const auto it = args.find(key);
  if (it == args.end()) {
    return fallback;
  }
  if (const auto *b = std::get_if<bool>(&it->second)) {
    return *b;
  }
  return fallback;
}

std::string tool_value_to_json(const ToolValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          std::ostringstream out;
          out.precision(17);
          out << v;
          return out.str();
        } else {
          return "\"" + common::json_escape(v) + "\"";
        }
      },
      value);
}

std::string tool_args_to_json(const ToolArgs &args) {
  std::vector<std::string> keys;
  keys.reserve(args.size());
  for (const auto &[key, value] : args) {
    keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());

  std::string out = "{";
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += "\"" + common::json_escape(keys[i]) + "\":" + tool_value_to_json(args.at(keys[i]));
  }
  out += "}";
  return out;
}

common::Result<ToolArgs> parse_tool_args(const std::string &json) {
  const std::string trimmed = [&json] {
    const auto first = common::json_skip_ws(json, 0);
    return first >= json.size() ? std::string() : json.substr(first);
  }();
  if (trimmed.empty()) {
    return common::Result<ToolArgs>::success({});
  }
  if (trimmed.front() != '{' ||
      common::json_find_matching_token(trimmed, 0, '{', '}') == std::string::npos) {
    return common::Result<ToolArgs>::failure("Arguments must be a JSON object",
                                             common::ErrorCode::Validation);
  }

  ToolArgs args;
  for (auto &[key, token] : common::json_parse_flat_typed(trimmed)) {
    switch (token.kind) {
    case common::JsonKind::String:
    case common::JsonKind::Object:
    case common::JsonKind::Array:
      args[key] = std::move(token.text);
      break;
    case common::JsonKind::Bool:
      args[key] = token.text == "true";
      break;
    case common::JsonKind::Null:
      args[key] = std::monostate{};
      break;
    case common::JsonKind::Number: {
      if (looks_integral(token.text)) {
        std::int64_t parsed = 0;
        const auto *first = token.text.data();
        const auto *last = first + token.text.size();
        auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec == std::errc() && ptr == last) {
          args[key] = parsed;
          break;
        }
      }
      char *end = nullptr;
      const double parsed = std::strtod(token.text.c_str(), &end);
      if (end == token.text.c_str() || *end != '\0') {
        return common::Result<ToolArgs>::failure("Invalid number for '" + key + "'",
                                                 common::ErrorCode::Validation);
      }
      args[key] = parsed;
      break;
    }
    }
  }
  return common::Result<ToolArgs>::success(std::move(args));
}

std::string params_to_schema(const std::vector<ParamSpec> &params) {
  std::string properties;
  std::string required;
  for (const auto &param : params) {
    if (!properties.empty()) {
      properties += ",";
    }
    properties += "\"" + common::json_escape(param.name) + "\":{\"type\":\"" +
                  std::string(param_type_name(param.type)) + "\"";
    if (!param.description.empty()) {
      properties += ",\"description\":\"" + common::json_escape(param.description) + "\"";
    }
    properties += "}";
    if (param.required) {
      if (!required.empty()) {
        required += ",";
      }
      required += "\"" + common::json_escape(param.name) + "\"";
    }
  }
  return "{\"type\":\"object\",\"properties\":{" + properties + "},\"required\":[" + required +
         "]}";
}

std::vector<ParamSpec> params_from_schema(const std::string &schema_json) {
  std::vector<ParamSpec> params;
  const auto required = common::json_get_string_array(schema_json, "required");
  const std::string properties = common::json_get_object(schema_json, "properties");

  for (const auto &[name, token] : common::json_parse_flat_typed(properties)) {
    ParamSpec spec;
    spec.name = name;
    if (token.kind == common::JsonKind::Object) {
      spec.type = param_type_from_name(common::json_get_string(token.text, "type"))
                      .value_or(ParamType::String);
      spec.description = common::json_get_string(token.text, "description");
    }
    spec.required = std::find(required.begin(), required.end(), name) != required.end();
    params.push_back(std::move(spec));
  }

  // required keys without a properties entry still have to be present
  for (const auto &name : required) {
    const bool known = std::any_of(params.begin(), params.end(),
                                   [&name](const ParamSpec &p) { return p.name == name; });
    if (!known) {
      params.push_back(ParamSpec{.name = name, .type = ParamType::String, .required = true});
    }
  }

  std::sort(params.begin(), params.end(),
            [](const ParamSpec &a, const ParamSpec &b) { return a.name < b.name; });
  return params;
}

} // namespace hostgate::tools
