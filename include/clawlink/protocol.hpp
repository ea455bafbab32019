#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace clawlink {

using json = nlohmann::json;

/// Gateway protocol version spoken by this client (min == max).
constexpr int kProtocolVersion = 3;
constexpr int kDefaultGatewayPort = 18789;

enum class connection_state { disconnected, connecting, connected, reconnecting };

inline const char *to_string(connection_state state) {
  switch (state) {
  case connection_state::disconnected:
    return "disconnected";
  case connection_state::connecting:
    return "connecting";
  case connection_state::connected:
    return "connected";
  case connection_state::reconnecting:
    return "reconnecting";
  }
  return "unknown";
}

// --- frames ---

struct request_frame {
  std::string id;
  std::string method;
  std::optional<json> params;
};

struct response_frame {
  std::string id;
  bool ok = false;
  std::optional<json> payload;
  std::optional<std::string> error_code;
  std::optional<std::string> error_message;
};

struct event_frame {
  std::string event;
  json payload = json::object();
};

using gateway_frame = std::variant<request_frame, response_frame, event_frame>;

namespace detail {

inline std::optional<std::string> optional_string(const json &obj,
                                                  const char *key) {
  if (!obj.is_object())
    return std::nullopt;
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}

inline std::optional<int64_t> optional_int(const json &obj, const char *key) {
  if (!obj.is_object())
    return std::nullopt;
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number())
    return std::nullopt;
  return it->get<int64_t>();
}

inline std::string required_string(const json &obj, const char *key) {
  auto value = optional_string(obj, key);
  if (!value)
    throw protocol_error(std::string("missing string field '") + key + "'");
  return *value;
}

inline std::optional<json> optional_object(const json &obj, const char *key) {
  if (!obj.is_object())
    return std::nullopt;
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_object())
    return std::nullopt;
  return *it;
}

} // namespace detail

inline std::string encode_frame(const gateway_frame &frame) {
  json out;
  if (auto *req = std::get_if<request_frame>(&frame)) {
    out = {{"type", "req"}, {"id", req->id}, {"method", req->method}};
    if (req->params)
      out["params"] = *req->params;
  } else if (auto *res = std::get_if<response_frame>(&frame)) {
    out = {{"type", "res"}, {"id", res->id}, {"ok", res->ok}};
    if (res->payload)
      out["payload"] = *res->payload;
    if (res->error_code || res->error_message) {
      out["error"] = {{"code", res->error_code.value_or("")},
                      {"message", res->error_message.value_or("")}};
    }
  } else {
    const auto &ev = std::get<event_frame>(frame);
    out = {{"type", "event"}, {"event", ev.event}, {"payload", ev.payload}};
  }
  return out.dump();
}

/// Parse one text frame. Throws protocol_error for bad JSON, an unknown
/// "type" or missing required fields.
inline gateway_frame decode_frame(std::string_view text) {
  json msg = json::parse(text.begin(), text.end(), nullptr, false);
  if (msg.is_discarded())
    throw protocol_error("frame is not valid JSON");
  if (!msg.is_object())
    throw protocol_error("frame is not a JSON object");

  std::string type = detail::required_string(msg, "type");

  if (type == "res") {
    response_frame res;
    res.id = detail::required_string(msg, "id");
    auto ok = msg.find("ok");
    res.ok = ok != msg.end() && ok->is_boolean() && ok->get<bool>();
    res.payload = detail::optional_object(msg, "payload");
    if (auto err = detail::optional_object(msg, "error")) {
      res.error_code = detail::optional_string(*err, "code");
      res.error_message = detail::optional_string(*err, "message");
    }
    return res;
  }

  if (type == "event") {
    event_frame ev;
    ev.event = detail::required_string(msg, "event");
    auto payload = msg.find("payload");
    if (payload != msg.end() && !payload->is_null()) {
      ev.payload = *payload;
    } else if (auto text_payload = detail::optional_string(msg, "payloadJSON")) {
      ev.payload = json::parse(*text_payload, nullptr, false);
      if (ev.payload.is_discarded())
        throw protocol_error("event '" + ev.event +
                             "' has unparseable payloadJSON");
    }
    return ev;
  }

  if (type == "req") {
    request_frame req;
    req.id = detail::required_string(msg, "id");
    req.method = detail::required_string(msg, "method");
    if (msg.contains("params"))
      req.params = msg["params"];
    return req;
  }

  throw protocol_error("unknown frame type '" + type + "'");
}

// --- RPC ---

/// Outcome of one request: the response fields, ok or not.
struct rpc_result {
  bool ok = false;
  std::optional<json> payload;
  std::optional<std::string> error_code;
  std::optional<std::string> error_message;

  static rpc_result from(const response_frame &res) {
    return {res.ok, res.payload, res.error_code, res.error_message};
  }
};

// --- events ---

enum class chat_state { delta, final, aborted, error };

struct chat_event {
  std::optional<std::string> run_id;
  std::optional<std::string> session_key;
  chat_state state = chat_state::delta;
  std::optional<std::string> error_message;
};

enum class agent_stream { assistant, tool, error };
enum class agent_phase { start, result };

struct agent_stream_data {
  std::optional<std::string> text;
  std::optional<agent_phase> phase;
  std::optional<std::string> name;
  std::optional<std::string> tool_call_id;
};

struct agent_stream_event {
  std::optional<std::string> run_id;
  agent_stream stream = agent_stream::assistant;
  std::optional<agent_stream_data> data;
};

inline const char *to_string(chat_state state) {
  switch (state) {
  case chat_state::delta:
    return "delta";
  case chat_state::final:
    return "final";
  case chat_state::aborted:
    return "aborted";
  case chat_state::error:
    return "error";
  }
  return "unknown";
}

inline const char *to_string(agent_stream stream) {
  switch (stream) {
  case agent_stream::assistant:
    return "assistant";
  case agent_stream::tool:
    return "tool";
  case agent_stream::error:
    return "error";
  }
  return "unknown";
}

inline chat_event parse_chat_event(const json &payload) {
  if (!payload.is_object())
    throw protocol_error("chat payload is not an object");

  auto state = detail::required_string(payload, "state");
  chat_event ev;
  if (state == "delta")
    ev.state = chat_state::delta;
  else if (state == "final")
    ev.state = chat_state::final;
  else if (state == "aborted")
    ev.state = chat_state::aborted;
  else if (state == "error")
    ev.state = chat_state::error;
  else
    throw protocol_error("unknown chat state '" + state + "'");

  ev.run_id = detail::optional_string(payload, "runId");
  ev.session_key = detail::optional_string(payload, "sessionKey");
  ev.error_message = detail::optional_string(payload, "errorMessage");
  return ev;
}

inline agent_stream_event parse_agent_event(const json &payload) {
  if (!payload.is_object())
    throw protocol_error("agent payload is not an object");

  auto stream = detail::required_string(payload, "stream");
  agent_stream_event ev;
  if (stream == "assistant")
    ev.stream = agent_stream::assistant;
  else if (stream == "tool")
    ev.stream = agent_stream::tool;
  else if (stream == "error")
    ev.stream = agent_stream::error;
  else
    throw protocol_error("unknown agent stream '" + stream + "'");

  ev.run_id = detail::optional_string(payload, "runId");
  if (auto data = detail::optional_object(payload, "data")) {
    agent_stream_data out;
    out.text = detail::optional_string(*data, "text");
    out.name = detail::optional_string(*data, "name");
    out.tool_call_id = detail::optional_string(*data, "toolCallId");
    auto phase = detail::optional_string(*data, "phase");
    if (phase == "start")
      out.phase = agent_phase::start;
    else if (phase == "result")
      out.phase = agent_phase::result;
    ev.data = std::move(out);
  }
  return ev;
}

// --- typed RPC payloads ---

struct agent_info {
  std::string id;
  std::string name;
};

struct agent_list {
  std::string default_id = "main";
  std::vector<agent_info> agents;
};

inline bool operator==(const agent_info &a, const agent_info &b) {
  return a.id == b.id && a.name == b.name;
}

inline bool operator==(const agent_list &a, const agent_list &b) {
  return a.default_id == b.default_id && a.agents == b.agents;
}

struct chat_history_message {
  std::string role;
  std::optional<std::string> content;
  std::optional<int64_t> timestamp_ms;
};

struct chat_history {
  std::optional<std::string> session_id;
  std::vector<chat_history_message> messages;
};

inline agent_list parse_agent_list(const json &payload) {
  agent_list out;
  out.default_id =
      detail::optional_string(payload, "defaultId").value_or("main");
  auto agents = payload.find("agents");
  if (agents == payload.end() || !agents->is_array())
    return out;

  for (const auto &item : *agents) {
    auto id = detail::optional_string(item, "id");
    if (!id)
      continue;
    out.agents.push_back(
        {*id, detail::optional_string(item, "name").value_or(*id)});
  }
  return out;
}

/// Messages keep server order; entries without a role are skipped and
/// content is the first text part.
inline chat_history parse_chat_history(const json &payload) {
  chat_history out;
  out.session_id = detail::optional_string(payload, "sessionId");
  auto messages = payload.find("messages");
  if (messages == payload.end() || !messages->is_array())
    return out;

  for (const auto &item : *messages) {
    auto role = detail::optional_string(item, "role");
    if (!role)
      continue;
    chat_history_message msg;
    msg.role = *role;
    auto content = item.find("content");
    if (content != item.end()) {
      if (content->is_array() && !content->empty())
        msg.content = detail::optional_string(content->front(), "text");
      else if (content->is_string())
        msg.content = content->get<std::string>();
    }
    msg.timestamp_ms = detail::optional_int(item, "timestamp");
    out.messages.push_back(std::move(msg));
  }
  return out;
}

} // namespace clawlink
