#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "config.hpp"
#include "device_identity.hpp"
#include "dispatcher.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "handshake.hpp"
#include "log.hpp"
#include "observable.hpp"
#include "protocol.hpp"
#include "session.hpp"
#include "supervisor.hpp"
#include "transport.hpp"
#include "worker.hpp"

namespace clawlink {

/// Auto-reconnecting gateway client. Owns the supervisor loop, the live
/// session and every observable the application reads.
///
/// Observable watchers run on internal threads and must not call
/// connect(), reconnect() or disconnect().
class gateway_client {
public:
  explicit gateway_client(
      client_options opts = {},
      std::shared_ptr<const device_identity> identity = nullptr,
      std::shared_ptr<credential_store> credentials = nullptr,
      std::shared_ptr<fault_reporter> reporter =
          std::make_shared<logging_fault_reporter>())
      : opts_(std::move(opts)), identity_(std::move(identity)),
        credentials_(std::move(credentials)),
        dispatcher_(opts_.event_channel_capacity),
        handshake_(opts_, identity_),
        supervisor_(
            [this](const gateway_endpoint &endpoint, const cancel_token &token,
                   const std::function<void()> &on_connected) {
              run_attempt(endpoint, token, on_connected);
            },
            [this]() { interrupt(); }, std::move(reporter),
            opts_.idle_poll_ms) {}

  ~gateway_client() {
    supervisor_.disconnect();
    worker_.stop();
  }

  gateway_client(const gateway_client &) = delete;
  gateway_client &operator=(const gateway_client &) = delete;

  // --- lifecycle ---

  /// Start (or retarget) the connection. Without a token the credential
  /// store's token is used. No-op when already targeting the same endpoint.
  void connect(const std::string &host, int port = kDefaultGatewayPort,
               std::optional<std::string> token = std::nullopt,
               bool use_tls = false) {
    if (host.empty())
      throw std::invalid_argument("host is required");
    if (!token && credentials_)
      token = credentials_->token();
    gateway_endpoint endpoint{host, port, std::move(token), use_tls};
    supervisor_.connect(endpoint);
  }

  void reconnect() { supervisor_.reconnect(); }

  /// Stops the loop, closes the socket and clears session-scoped state.
  void disconnect() {
    supervisor_.disconnect();
    clear_session_state();
    {
      std::lock_guard<std::mutex> lock(publish_mu_);
      agent_list_.set(std::nullopt);
    }
    logger()->info("disconnected from gateway");
  }

  bool is_connected() const {
    return supervisor_.state().get() == connection_state::connected;
  }

  // --- RPC ---

  /// Raw request on the live session. Throws connection_lost_error when not
  /// connected, request_timeout_error on expiry.
  rpc_result request(const std::string &method,
                     const std::optional<json> &params = std::nullopt,
                     int timeout_ms = 0) {
    auto session = active_.get();
    if (!session)
      throw connection_lost_error("not connected to gateway");
    return session->request(method, params,
                            timeout_ms > 0 ? timeout_ms
                                           : opts_.request_timeout_ms);
  }

  /// Returns the run id when the gateway reports one.
  std::optional<std::string>
  send_chat(const std::string &session_key, const std::string &message,
            const std::optional<std::string> &thinking = std::nullopt) {
    json params = {{"sessionKey", session_key},
                   {"message", message},
                   {"timeoutMs", 30000},
                   {"idempotencyKey", generate_uuid()}};
    if (thinking && !thinking->empty() && *thinking != "off")
      params["thinking"] = *thinking;

    auto result = request("chat.send", params, opts_.chat_timeout_ms);
    throw_unless_ok("chat.send", result);
    auto run_id = result.payload
                      ? detail::optional_string(*result.payload, "runId")
                      : std::nullopt;
    logger()->debug("chat.send ok, run {}", run_id.value_or("(none)"));
    return run_id;
  }

  /// Failures are logged, not raised.
  void abort_chat(const std::string &session_key,
                  const std::optional<std::string> &run_id = std::nullopt) {
    json params = {{"sessionKey", session_key}};
    if (run_id)
      params["runId"] = *run_id;
    try {
      auto result = request("chat.abort", params, opts_.short_timeout_ms);
      if (!result.ok)
        logger()->warn("chat.abort rejected: {}",
                       result.error_message.value_or("unknown"));
    } catch (const gateway_error &e) {
      logger()->warn("chat.abort failed: {}", e.what());
    }
  }

  chat_history get_chat_history(const std::string &session_key) {
    auto result = request("chat.history", json{{"sessionKey", session_key}});
    throw_unless_ok("chat.history", result);
    return parse_chat_history(result.payload.value_or(json::object()));
  }

  /// Also publishes the list, or the missing-scope error, on the
  /// corresponding observables while the answering session is still live.
  agent_list get_agent_list() {
    auto session = active_.get();
    if (!session)
      throw connection_lost_error("not connected to gateway");
    auto result =
        session->request("agents.list", std::nullopt, opts_.request_timeout_ms);

    std::lock_guard<std::mutex> lock(publish_mu_);
    bool live = active_.get() == session;
    if (!result.ok) {
      std::string message = result.error_message.value_or(
          result.error_code.value_or("unknown error"));
      if (live && contains_ignore_case(message, "missing scope"))
        missing_scope_error_.set(message);
      throw rpc_error("agents.list", result.error_code.value_or(""), message);
    }
    auto list = parse_agent_list(result.payload.value_or(json::object()));
    logger()->debug("agents.list returned {} agent(s)", list.agents.size());
    if (live) {
      missing_scope_error_.set(std::nullopt);
      agent_list_.set(list);
    }
    return list;
  }

  bool check_health() {
    try {
      return request("health", std::nullopt, opts_.short_timeout_ms).ok;
    } catch (const gateway_error &e) {
      logger()->debug("health check failed: {}", e.what());
      return false;
    }
  }

  // --- observables ---

  const state_cell<connection_state> &state() const {
    return supervisor_.state();
  }
  const state_cell<std::optional<std::string>> &streaming_text() const {
    return dispatcher_.streaming_text();
  }
  const state_cell<std::optional<agent_list>> &agents() const {
    return agent_list_;
  }
  const state_cell<std::optional<std::string>> &missing_scope_error() const {
    return missing_scope_error_;
  }
  const state_cell<bool> &pairing_required() const {
    return pairing_required_;
  }
  bool is_pairing_required() const { return pairing_required_.get(); }

  broadcast_channel<chat_event>::subscription subscribe_chat() {
    return dispatcher_.chat_events().subscribe();
  }
  broadcast_channel<agent_stream_event>::subscription subscribe_agent() {
    return dispatcher_.agent_events().subscribe();
  }

  std::optional<std::string> main_session_key() const {
    return main_session_key_.get();
  }
  std::optional<std::string> device_id() const {
    if (!identity_)
      return std::nullopt;
    return identity_->device_id();
  }
  int reconnect_attempt() const { return supervisor_.attempt(); }

private:
  static bool contains_ignore_case(std::string text, std::string needle) {
    auto lower = [](std::string &s) {
      std::transform(s.begin(), s.end(), s.begin(),
                     [](unsigned char c) { return std::tolower(c); });
    };
    lower(text);
    lower(needle);
    return text.find(needle) != std::string::npos;
  }

  static void throw_unless_ok(const std::string &method,
                              const rpc_result &result) {
    if (!result.ok)
      throw rpc_error(method, result.error_code.value_or(""),
                      result.error_message.value_or(""));
  }

  void clear_session_state() {
    main_session_key_.set(std::nullopt);
    dispatcher_.streaming_text().set(std::nullopt);
  }

  /// Runs on the supervisor thread.
  void run_attempt(const gateway_endpoint &endpoint, const cancel_token &token,
                   const std::function<void()> &on_connected) {
    clear_session_state();
    websocket_options ws;
    ws.host = endpoint.host;
    ws.port = endpoint.port;
    ws.use_tls = endpoint.use_tls;
    ws.connect_timeout_ms = opts_.socket_connect_timeout_ms;
    if (credentials_)
      ws.tls_pin = credentials_->tls_pin();
    ws.cancelled = [&token]() { return token.cancelled(); };

    std::string url = websocket_url(ws);
    logger()->info("connecting to {}", url);

    dispatcher_.challenge().arm();
    auto session = std::make_shared<socket_session>(
        websocket_connection::open(ws),
        [this](const event_frame &ev) { dispatcher_.dispatch(ev); });
    session_scope scope(*this, session);
    if (token.cancelled())
      throw connection_lost_error("connection attempt cancelled");
    session->start();

    handshake_result accepted;
    try {
      accepted = handshake_.run(*session, dispatcher_.challenge(),
                                endpoint.token);
    } catch (const handshake_error &e) {
      if (e.pairing_required()) {
        pairing_required_.set(true);
        logger()->warn("gateway requires device pairing (device {})",
                       device_id().value_or("none"));
      }
      throw;
    }

    pairing_required_.set(false);
    main_session_key_.set(accepted.main_session_key);
    active_.set(session);
    on_connected();
    logger()->info("connected to {}, main session key {}", url,
                   accepted.main_session_key.value_or("(none)"));

    if (opts_.auto_fetch_agents)
      worker_.post([this]() { fetch_agents(); });

    serve(*session);
    logger()->info("disconnected from {}: {}", url, session->close_reason());
    clear_session_state();
  }

  /// Blocks until the session ends, pinging at the heartbeat interval and
  /// dropping a connection that has gone silent for two intervals.
  void serve(socket_session &session) {
    int interval = opts_.heartbeat_interval_ms;
    if (interval <= 0) {
      while (!session.wait_closed(60000)) {
      }
      return;
    }
    while (!session.wait_closed(interval)) {
      int64_t idle = steady_now_ms() - session.last_activity_ms();
      if (idle >= 2 * static_cast<int64_t>(interval)) {
        logger()->warn("gateway silent for {} ms, dropping connection", idle);
        session.abort("heartbeat timeout");
        break;
      }
      if (!session.ping())
        session.abort("heartbeat ping failed");
    }
  }

  void fetch_agents() {
    try {
      get_agent_list();
    } catch (const gateway_error &e) {
      logger()->warn("agent list fetch failed: {}", e.what());
    }
  }

  /// Runs on the caller of connect/reconnect/disconnect.
  void interrupt() {
    dispatcher_.challenge().disarm();
    if (auto session = session_.get())
      session->close("closed by client");
  }

  /// Publishes the session for interrupt() and retracts it on exit.
  class session_scope {
  public:
    session_scope(gateway_client &client,
                  const std::shared_ptr<socket_session> &session)
        : client_(client), session_(session) {
      client_.session_.set(session_);
    }
    ~session_scope() {
      client_.active_.set(nullptr);
      client_.session_.set(nullptr);
      client_.dispatcher_.challenge().disarm();
      session_->close("connection attempt ended");
    }

  private:
    gateway_client &client_;
    std::shared_ptr<socket_session> session_;
  };

  client_options opts_;
  std::shared_ptr<const device_identity> identity_;
  std::shared_ptr<credential_store> credentials_;

  event_dispatcher dispatcher_;
  auth_handshake handshake_;

  state_cell<std::shared_ptr<socket_session>> session_;
  state_cell<std::shared_ptr<socket_session>> active_;
  state_cell<std::optional<std::string>> main_session_key_;
  state_cell<std::optional<agent_list>> agent_list_;
  state_cell<std::optional<std::string>> missing_scope_error_;
  state_cell<bool> pairing_required_{false};
  // Orders agent-list publication against disconnect().
  std::mutex publish_mu_;

  task_worker worker_;
  connection_supervisor supervisor_;
};

} // namespace clawlink
