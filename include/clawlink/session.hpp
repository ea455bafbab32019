#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "encoding.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "pending_table.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace clawlink {

/// One physical gateway connection: a reader thread routing responses to
/// the pending table and events to `on_event`, plus serialized writes.
/// Closes exactly once; closing fails every outstanding request.
class socket_session {
public:
  using event_fn = std::function<void(const event_frame &)>;

  socket_session(std::unique_ptr<websocket_connection> conn, event_fn on_event)
      : conn_(std::move(conn)), on_event_(std::move(on_event)) {}

  ~socket_session() {
    close("session destroyed");
    if (reader_.joinable()) {
      if (reader_.get_id() == std::this_thread::get_id())
        reader_.detach();
      else
        reader_.join();
    }
  }

  socket_session(const socket_session &) = delete;
  socket_session &operator=(const socket_session &) = delete;

  void start() {
    reader_ = std::thread([this]() { read_loop(); });
  }

  /// Send one request and wait for its response. Throws
  /// request_timeout_error or connection_lost_error.
  rpc_result request(const std::string &method, const std::optional<json> &params,
                     int timeout_ms) {
    if (closed_.load()) {
      throw connection_lost_error("not connected: " + close_reason());
    }

    std::string id = generate_uuid();
    auto call = pending_.add(id);
    if (closed_.load()) {
      pending_.remove(id);
      throw connection_lost_error("not connected: " + close_reason());
    }

    logger()->debug("-> {} ({})", method, id);
    try {
      conn_->send_text(encode_frame(request_frame{id, method, params}));
    } catch (const transport_error &e) {
      pending_.remove(id);
      close(e.what());
      throw connection_lost_error(std::string("send failed: ") + e.what());
    }
    return pending_.wait(id, call, method, timeout_ms);
  }

  /// Idempotent. Sends a close frame and fails pending requests.
  void close(const std::string &reason = "closed by client") {
    if (mark_closed(reason))
      conn_->close();
  }

  /// Tear down without a close handshake.
  void abort(const std::string &reason) {
    if (mark_closed(reason))
      conn_->abort();
  }

  bool is_closed() const { return closed_.load(); }

  /// Returns true once the session has closed, false on timeout.
  bool wait_closed(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                        [this]() { return closed_.load(); });
  }

  std::string close_reason() const {
    std::lock_guard<std::mutex> lock(mu_);
    return reason_;
  }

  bool ping() { return conn_->send_ping(); }
  int64_t last_activity_ms() const { return conn_->last_activity_ms(); }
  size_t pending_count() const { return pending_.size(); }

private:
  void read_loop() {
    std::string reason = "connection closed by gateway";
    try {
      for (;;) {
        auto text = conn_->read_text();
        if (!text)
          break;
        route(*text);
      }
    } catch (const std::exception &e) {
      reason = e.what();
    }
    if (mark_closed(reason)) {
      logger()->info("gateway session closed: {}", reason);
      conn_->abort();
    }
  }

  void route(const std::string &text) {
    gateway_frame frame;
    try {
      frame = decode_frame(text);
    } catch (const protocol_error &e) {
      logger()->warn("dropping frame: {} ({})", e.what(), clip(text));
      return;
    }

    if (auto *res = std::get_if<response_frame>(&frame)) {
      if (!pending_.resolve(*res))
        logger()->debug("orphaned response {}", res->id);
    } else if (auto *ev = std::get_if<event_frame>(&frame)) {
      if (on_event_)
        on_event_(*ev);
    } else {
      logger()->debug("ignoring gateway request '{}'",
                      std::get<request_frame>(frame).method);
    }
  }

  /// First caller wins; the table is failed after the flag is visible so a
  /// racing request() either sees the flag or gets failed.
  bool mark_closed(const std::string &reason) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_.load())
        return false;
      reason_ = reason;
      closed_.store(true);
    }
    size_t failed = pending_.fail_all("connection lost: " + reason);
    if (failed > 0)
      logger()->debug("failed {} pending request(s)", failed);
    cv_.notify_all();
    return true;
  }

  std::unique_ptr<websocket_connection> conn_;
  event_fn on_event_;
  pending_table pending_;
  std::thread reader_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> closed_{false};
  std::string reason_;
};

} // namespace clawlink
