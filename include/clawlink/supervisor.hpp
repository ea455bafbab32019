#pragma once

#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "observable.hpp"
#include "protocol.hpp"

namespace clawlink {

/// Where the caller wants to be connected. Compared by value.
struct gateway_endpoint {
  std::string host;
  int port = kDefaultGatewayPort;
  std::optional<std::string> token;
  bool use_tls = false;
};

inline bool operator==(const gateway_endpoint &a, const gateway_endpoint &b) {
  return a.host == b.host && a.port == b.port && a.token == b.token &&
         a.use_tls == b.use_tls;
}

inline bool operator!=(const gateway_endpoint &a, const gateway_endpoint &b) {
  return !(a == b);
}

constexpr int kMaxBackoffMs = 8000;

/// Delay before the next try after `attempt` consecutive failures.
inline int backoff_delay_ms(int attempt) {
  double delay = 350.0 * std::pow(1.7, static_cast<double>(attempt));
  return static_cast<int>(std::min(static_cast<double>(kMaxBackoffMs), delay));
}

/// Identifies one run of the supervisor loop. Once a newer run starts (or
/// the loop is stopped) the token reports cancelled.
class cancel_token {
public:
  cancel_token(const std::atomic<uint64_t> *generation, uint64_t mine)
      : generation_(generation), mine_(mine) {}

  bool cancelled() const { return generation_->load() != mine_; }
  uint64_t generation() const { return mine_; }

private:
  const std::atomic<uint64_t> *generation_;
  uint64_t mine_;
};

/// Keeps one connection alive to the desired endpoint, retrying with
/// backoff. At most one loop thread runs; a restart stops and joins the old
/// loop before launching the next.
class connection_supervisor {
public:
  /// Connects, authenticates and serves one session. Calls `on_connected`
  /// once the session is usable, returns when it ends, throws if it never
  /// became usable.
  using attempt_fn = std::function<void(const gateway_endpoint &,
                                        const cancel_token &,
                                        const std::function<void()> &)>;
  /// Tears down whatever the current attempt holds open.
  using interrupt_fn = std::function<void()>;

  connection_supervisor(attempt_fn run_attempt, interrupt_fn interrupt,
                        std::shared_ptr<fault_reporter> reporter,
                        int idle_poll_ms = 250)
      : run_attempt_(std::move(run_attempt)), interrupt_(std::move(interrupt)),
        reporter_(std::move(reporter)), idle_poll_ms_(idle_poll_ms) {}

  ~connection_supervisor() {
    std::lock_guard<std::mutex> lock(control_mu_);
    stop_loop_locked();
  }

  connection_supervisor(const connection_supervisor &) = delete;
  connection_supervisor &operator=(const connection_supervisor &) = delete;

  /// Restarts the loop when the endpoint differs from the current one or no
  /// loop is running. Returns true if it restarted.
  bool connect(const gateway_endpoint &endpoint) {
    std::lock_guard<std::mutex> lock(control_mu_);
    if (loop_.joinable() && desired_.get() == endpoint)
      return false;
    desired_.set(endpoint);
    restart_locked();
    return true;
  }

  /// Skip any pending backoff and start over with the same endpoint.
  void reconnect() {
    std::lock_guard<std::mutex> lock(control_mu_);
    if (!desired_.get()) {
      logger()->debug("reconnect ignored, no endpoint set");
      return;
    }
    logger()->info("manual reconnect requested");
    restart_locked();
  }

  void disconnect() {
    std::lock_guard<std::mutex> lock(control_mu_);
    desired_.set(std::nullopt);
    stop_loop_locked();
    state_.set(connection_state::disconnected);
  }

  const state_cell<connection_state> &state() const { return state_; }
  std::optional<gateway_endpoint> desired() const { return desired_.get(); }
  /// Consecutive failures of the running loop.
  int attempt() const { return attempt_.load(); }
  uint64_t generation() const { return generation_.load(); }

private:
  void restart_locked() {
    stop_loop_locked();
    cancel_token token(&generation_, generation_.load());
    loop_ = std::thread([this, token]() { run_loop(token); });
  }

  void stop_loop_locked() {
    if (loop_.joinable() && loop_.get_id() == std::this_thread::get_id()) {
      throw std::logic_error(
          "connection lifecycle called from the supervisor thread");
    }
    {
      std::lock_guard<std::mutex> lock(wake_mu_);
      generation_.fetch_add(1);
    }
    wake_cv_.notify_all();
    if (loop_.joinable()) {
      if (interrupt_)
        interrupt_();
      loop_.join();
    }
    attempt_.store(0);
  }

  /// Returns false if the token was cancelled while sleeping.
  bool sleep_unless_cancelled(int duration_ms, const cancel_token &token) {
    std::unique_lock<std::mutex> lock(wake_mu_);
    wake_cv_.wait_for(lock, std::chrono::milliseconds(duration_ms),
                      [&token]() { return token.cancelled(); });
    return !token.cancelled();
  }

  void set_state(const cancel_token &token, connection_state state) {
    if (!token.cancelled())
      state_.set(state);
  }

  void run_loop(cancel_token token) {
    int attempt = 0;
    attempt_.store(0);
    while (!token.cancelled()) {
      auto endpoint = desired_.get();
      if (!endpoint) {
        sleep_unless_cancelled(idle_poll_ms_, token);
        continue;
      }

      set_state(token, attempt == 0 ? connection_state::connecting
                                    : connection_state::reconnecting);
      try {
        run_attempt_(*endpoint, token, [this, &attempt, &token]() {
          attempt = 0;
          attempt_.store(0);
          set_state(token, connection_state::connected);
        });
        set_state(token, connection_state::disconnected);
      } catch (const std::exception &e) {
        if (token.cancelled())
          break;
        logger()->warn("gateway connection failed (attempt {}): {}", attempt,
                       e.what());
        if (attempt == 0 && !is_transient_network_error(e) && reporter_)
          reporter_->record_exception(e);
        ++attempt;
        attempt_.store(attempt);
        set_state(token, connection_state::reconnecting);
        sleep_unless_cancelled(backoff_delay_ms(attempt), token);
      }
    }
  }

  attempt_fn run_attempt_;
  interrupt_fn interrupt_;
  std::shared_ptr<fault_reporter> reporter_;
  int idle_poll_ms_;

  std::mutex control_mu_;
  std::thread loop_;

  std::mutex wake_mu_;
  std::condition_variable wake_cv_;
  std::atomic<uint64_t> generation_{0};
  std::atomic<int> attempt_{0};

  state_cell<std::optional<gateway_endpoint>> desired_;
  state_cell<connection_state> state_{connection_state::disconnected};
};

} // namespace clawlink
