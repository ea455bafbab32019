#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "log.hpp"
#include "observable.hpp"
#include "protocol.hpp"

namespace clawlink {

/// Hand-off point for the `connect.challenge` nonce. Only an armed slot
/// accepts a nonce, and only the first one; challenges outside a handshake
/// are ignored.
class challenge_slot {
public:
  void arm() {
    std::lock_guard<std::mutex> lock(mu_);
    armed_ = true;
    nonce_.reset();
  }

  /// Wakes a pending wait() with no nonce.
  void disarm() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      armed_ = false;
      nonce_.reset();
    }
    cv_.notify_all();
  }

  /// Returns false if the nonce was ignored.
  bool deliver(const std::string &nonce) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!armed_ || nonce_)
        return false;
      nonce_ = nonce;
    }
    cv_.notify_all();
    return true;
  }

  /// Waits for the nonce. Disarms the slot either way.
  std::optional<std::string> wait(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                 [this]() { return nonce_.has_value() || !armed_; });
    auto nonce = nonce_;
    armed_ = false;
    nonce_.reset();
    return nonce;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool armed_ = false;
  std::optional<std::string> nonce_;
};

/// Routes event frames by name onto typed channels.
class event_dispatcher {
public:
  explicit event_dispatcher(size_t channel_capacity = 64)
      : chat_events_(channel_capacity), agent_events_(channel_capacity) {}

  void dispatch(const event_frame &ev) {
    if (ev.event == "tick") {
      ++ticks_;
      return;
    }
    if (ev.event == "connect.challenge") {
      auto nonce = detail::optional_string(ev.payload, "nonce");
      if (!nonce) {
        logger()->warn("connect.challenge without nonce dropped");
        return;
      }
      if (!challenge_.deliver(*nonce))
        logger()->debug("ignoring connect.challenge outside handshake");
      return;
    }

    try {
      if (ev.event == "chat") {
        chat_events_.publish(parse_chat_event(ev.payload));
      } else if (ev.event == "agent") {
        auto agent = parse_agent_event(ev.payload);
        if (agent.stream == agent_stream::assistant && agent.data &&
            agent.data->text && !agent.data->text->empty()) {
          streaming_text_.set(agent.data->text);
        }
        agent_events_.publish(agent);
      } else {
        logger()->debug("unhandled gateway event '{}'", ev.event);
      }
    } catch (const protocol_error &e) {
      logger()->warn("dropping malformed '{}' event: {} ({})", ev.event,
                     e.what(), clip(ev.payload.dump()));
    } catch (const json::exception &e) {
      logger()->warn("dropping malformed '{}' event: {}", ev.event, e.what());
    }
  }

  broadcast_channel<chat_event> &chat_events() { return chat_events_; }
  broadcast_channel<agent_stream_event> &agent_events() {
    return agent_events_;
  }
  state_cell<std::optional<std::string>> &streaming_text() {
    return streaming_text_;
  }
  const state_cell<std::optional<std::string>> &streaming_text() const {
    return streaming_text_;
  }
  challenge_slot &challenge() { return challenge_; }
  uint64_t ticks() const { return ticks_.load(); }

private:
  broadcast_channel<chat_event> chat_events_;
  broadcast_channel<agent_stream_event> agent_events_;
  state_cell<std::optional<std::string>> streaming_text_;
  challenge_slot challenge_;
  std::atomic<uint64_t> ticks_{0};
};

} // namespace clawlink
