/**
 * @file tool_protocol.hpp
 * @brief JSON mapping of tool calls, replies and progress notifications.
 *
 * Framing is line-delimited JSON-RPC 2.0. Only the payload shapes live here;
 * the read loop belongs to the front end.
 *
 *   tools/call params  {"name": "build", "arguments": {...}}
 *   result             {"content": [{"type": "text", "text": "..."}],
 *                       "isError": false}
 *   notification       {"method": "notifications/progress",
 *                       "params": {"progressToken": "op_..", ...}}
 */

#ifndef ORCA_TOOL_PROTOCOL_HPP_
#define ORCA_TOOL_PROTOCOL_HPP_

#include "orca/dispatcher.hpp"
#include "orca/notifier.hpp"
#include "orca/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace orca {

using json = nlohmann::json;

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "orca";
constexpr const char* kServerVersion = "0.1.0";

/// JSON-RPC error codes used by the front end.
enum class RpcErrorCode : int32_t {
  kParseError = -32700,
  kInvalidRequest = -32600,
  kMethodNotFound = -32601,
  kInvalidParams = -32602,
};

namespace detail {

inline ToolError BadArgument(const std::string& what) {
  return MakeToolError(ToolErrorCode::kInvalidRequest, what);
}

inline bool ReadStringList(const json& v, std::vector<std::string>& out) {
  if (!v.is_array()) return false;
  for (const auto& item : v) {
    if (!item.is_string()) return false;
    out.push_back(item.get<std::string>());
  }
  return true;
}

}  // namespace detail

// ============================================================================
// Requests
// ============================================================================

/**
 * @brief Decode tools/call params into a ToolRequest.
 *
 * wait accepts only the plural operation_ids form; timeout_secs and the
 * singular operation_id are rejected so callers never rely on them.
 */
inline expected<ToolRequest, ToolError> ParseToolCall(const json& params) {
  using Result = expected<ToolRequest, ToolError>;
  if (!params.is_object()) {
    return Result::error(detail::BadArgument("params must be an object"));
  }
  auto name = params.find("name");
  if (name == params.end() || !name->is_string()) {
    return Result::error(detail::BadArgument("params.name must be a string"));
  }

  ToolRequest req;
  req.tool = name->get<std::string>();

  static const json kEmpty = json::object();
  auto args_it = params.find("arguments");
  const json& args = (args_it == params.end() || args_it->is_null()) ? kEmpty : *args_it;
  if (!args.is_object()) {
    return Result::error(detail::BadArgument("arguments must be an object"));
  }

  if (req.tool == "wait") {
    if (args.contains("timeout_secs")) {
      return Result::error(detail::BadArgument(
          "wait does not accept timeout_secs; it returns when the operations "
          "finish or their own timeout passes"));
    }
    if (args.contains("operation_id")) {
      return Result::error(detail::BadArgument(
          "wait takes operation_ids (a list), not operation_id"));
    }
  }

  for (auto it = args.begin(); it != args.end(); ++it) {
    const std::string& key = it.key();
    const json& v = it.value();
    if (key == "working_directory") {
      if (!v.is_string()) return Result::error(detail::BadArgument(key + " must be a string"));
      req.working_directory = v.get<std::string>();
    } else if (key == "args" || key == "additional_args") {
      if (!detail::ReadStringList(v, req.args)) {
        return Result::error(detail::BadArgument(key + " must be a list of strings"));
      }
    } else if (key == "enable_async_notification" || key == "enable_async_notifications") {
      if (!v.is_boolean()) return Result::error(detail::BadArgument(key + " must be a boolean"));
      req.enable_async_notification = v.get<bool>();
    } else if (key == "operation_id") {
      if (!v.is_string()) return Result::error(detail::BadArgument(key + " must be a string"));
      req.operation_id = v.get<std::string>();
    } else if (key == "operation_ids") {
      if (!detail::ReadStringList(v, req.operation_ids)) {
        return Result::error(detail::BadArgument(key + " must be a list of strings"));
      }
    } else if (key == "duration_ms") {
      if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
        return Result::error(
            detail::BadArgument(key + " must be a non-negative integer"));
      }
      req.duration_ms = v.get<uint64_t>();
      if (*req.duration_ms > kMaxSleepMs) {
        return Result::error(detail::BadArgument(
            key + " must not exceed " + std::to_string(kMaxSleepMs)));
      }
    } else if (key == "state_filter") {
      if (!v.is_string()) return Result::error(detail::BadArgument(key + " must be a string"));
      req.state_filter = v.get<std::string>();
    }
    // Unknown keys are ignored so older callers keep working.
  }
  return Result::success(std::move(req));
}

// ============================================================================
// Replies
// ============================================================================

inline json TextContent(const std::string& text, bool is_error) {
  json content = json::array();
  content.push_back({{"type", "text"}, {"text", text}});
  return json{{"content", std::move(content)}, {"isError", is_error}};
}

inline json ReplyToJson(const ToolReply& reply) {
  json j = TextContent(reply.text, reply.is_error);
  if (reply.operation_id.has_value()) {
    j["_meta"] = {{"operation_id", *reply.operation_id}};
  }
  return j;
}

inline json ToolErrorToJson(const ToolError& err) {
  json j = TextContent(err.message, true);
  j["_meta"] = {{"error_code", ToolErrorMarker(err.code)}};
  return j;
}

inline json ToolListJson(const std::vector<ToolDescriptor>& tools) {
  json list = json::array();
  for (const auto& t : tools) {
    json props = json::object();
    json required = json::array();
    if (t.name == "status") {
      props["operation_id"] = {{"type", "string"}};
      props["working_directory"] = {{"type", "string"}};
      props["state_filter"] = {{"type", "string"}};
    } else if (t.name == "wait") {
      props["operation_ids"] = {{"type", "array"}, {"items", {{"type", "string"}}},
                                {"minItems", 1}};
      required.push_back("operation_ids");
    } else if (t.name == "sleep") {
      props["duration_ms"] = {
          {"type", "integer"}, {"minimum", 0}, {"maximum", kMaxSleepMs}};
      props["operation_id"] = {{"type", "string"}};
      props["enable_async_notification"] = {{"type", "boolean"}};
      required.push_back("duration_ms");
    } else {
      props["working_directory"] = {{"type", "string"}};
      props["args"] = {{"type", "array"}, {"items", {{"type", "string"}}}};
      if (t.kind == CommandKind::kLongRunning) {
        props["enable_async_notification"] = {{"type", "boolean"}};
        props["operation_id"] = {{"type", "string"}};
      }
      required.push_back("working_directory");
    }
    list.push_back({{"name", t.name},
                    {"description", t.description},
                    {"inputSchema",
                     {{"type", "object"}, {"properties", props}, {"required", required}}}});
  }
  return json{{"tools", std::move(list)}};
}

// ============================================================================
// Notifications
// ============================================================================

inline json ProgressToJson(const ProgressUpdate& update) {
  json params = {{"progressToken", OperationIdOf(update)},
                 {"kind", UpdateKindName(update)},
                 {"message", ToString(update)}};
  std::visit(
      [&params](const auto& u) {
        using T = std::decay_t<decltype(u)>;
        if constexpr (std::is_same_v<T, progress::Started>) {
          params["progress"] = 0;
          params["command"] = u.command;
          params["description"] = u.description;
        } else if constexpr (std::is_same_v<T, progress::Progress>) {
          if (u.percentage.has_value()) params["progress"] = *u.percentage;
          if (u.current_step.has_value()) params["step"] = *u.current_step;
        } else if constexpr (std::is_same_v<T, progress::Output>) {
          params["line"] = u.line;
          params["stream"] = u.is_stderr ? "stderr" : "stdout";
        } else {
          params["progress"] = 100;
          params["total"] = 100;
          params["state"] = StatusString(u.state);
          params["duration_ms"] = u.duration.count();
          params["report"] = u.report;
        }
      },
      update);
  return json{{"jsonrpc", kJsonRpcVersion},
              {"method", "notifications/progress"},
              {"params", std::move(params)}};
}

// ============================================================================
// JSON-RPC envelopes
// ============================================================================

inline json InitializeResult() {
  return json{{"protocolVersion", kProtocolVersion},
              {"capabilities", {{"tools", json::object()}}},
              {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}};
}

inline json MakeRpcResult(const json& id, json result) {
  return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", std::move(result)}};
}

inline json MakeRpcError(const json& id, RpcErrorCode code, const std::string& message) {
  return json{{"jsonrpc", kJsonRpcVersion},
              {"id", id},
              {"error", {{"code", static_cast<int32_t>(code)}, {"message", message}}}};
}

/// @brief Non-throwing parse; kParseError on malformed input.
inline expected<json, RpcErrorCode> ParseRpcLine(const std::string& line) {
  json j = json::parse(line, nullptr, false);
  if (j.is_discarded()) {
    return expected<json, RpcErrorCode>::error(RpcErrorCode::kParseError);
  }
  if (!j.is_object() || !j.contains("method") || !j["method"].is_string()) {
    return expected<json, RpcErrorCode>::error(RpcErrorCode::kInvalidRequest);
  }
  return expected<json, RpcErrorCode>::success(std::move(j));
}

}  // namespace orca

#endif  // ORCA_TOOL_PROTOCOL_HPP_
