#pragma once

// In-process gateway for client tests. Accepts one WebSocket client at a
// time on 127.0.0.1, records every request and answers through a script.

#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "../include/clawlink/protocol.hpp"
#include "../include/clawlink/transport.hpp"

namespace clawlink_test {

using clawlink::json;

class fake_gateway {
public:
  /// Returns the response to send, or nothing to stay silent.
  using script_fn = std::function<std::optional<clawlink::response_frame>(
      fake_gateway &, const clawlink::request_frame &)>;

  fake_gateway() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) !=
            0 ||
        ::listen(listen_fd_, 8) != 0) {
      throw std::runtime_error("fake gateway cannot listen");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    script_ = default_script();
    thread_ = std::thread([this]() { serve(); });
  }

  ~fake_gateway() {
    running_.store(false);
    drop_client();
    if (thread_.joinable())
      thread_.join();
    ::close(listen_fd_);
  }

  int port() const { return port_; }

  void set_script(script_fn script) {
    std::lock_guard<std::mutex> lock(mu_);
    script_ = std::move(script);
  }

  /// Nonce sent as connect.challenge right after each upgrade.
  void set_challenge(std::optional<std::string> nonce) {
    std::lock_guard<std::mutex> lock(mu_);
    challenge_ = std::move(nonce);
  }

  /// Accepted TCP connections are closed without an upgrade.
  void set_refuse(bool refuse) { refuse_.store(refuse); }

  static clawlink::response_frame ok(const std::string &id,
                                     json payload = json::object()) {
    clawlink::response_frame res;
    res.id = id;
    res.ok = true;
    res.payload = std::move(payload);
    return res;
  }

  static clawlink::response_frame fail(const std::string &id,
                                       const std::string &code,
                                       const std::string &message) {
    clawlink::response_frame res;
    res.id = id;
    res.ok = false;
    res.error_code = code;
    res.error_message = message;
    return res;
  }

  /// Accepts connect with mainSessionKey "main" and answers the rest ok.
  static script_fn default_script() {
    return [](fake_gateway &, const clawlink::request_frame &req)
               -> std::optional<clawlink::response_frame> {
      if (req.method == "connect") {
        return ok(req.id,
                  {{"snapshot",
                    {{"sessionDefaults", {{"mainSessionKey", "main"}}}}}});
      }
      if (req.method == "agents.list") {
        return ok(req.id, {{"defaultId", "main"},
                           {"agents", json::array({{{"id", "main"},
                                                    {"name", "Main"}}})}});
      }
      return ok(req.id);
    };
  }

  bool send_text(const std::string &text) {
    std::lock_guard<std::mutex> lock(send_mu_);
    if (client_fd_ < 0)
      return false;
    auto frame = clawlink::encode_ws_frame(clawlink::kOpText, text);
    return send_all(client_fd_, frame.data(), frame.size());
  }

  bool send_event(const std::string &name, const json &payload) {
    return send_text(
        clawlink::encode_frame(clawlink::event_frame{name, payload}));
  }

  bool send_response(const clawlink::response_frame &res) {
    return send_text(clawlink::encode_frame(res));
  }

  /// Abruptly ends the current client connection.
  void drop_client() {
    std::lock_guard<std::mutex> lock(send_mu_);
    if (client_fd_ >= 0)
      ::shutdown(client_fd_, SHUT_RDWR);
  }

  std::vector<clawlink::request_frame> requests() const {
    std::lock_guard<std::mutex> lock(mu_);
    return requests_;
  }

  /// Waits for the n-th (1-based) request with this method.
  std::optional<clawlink::request_frame>
  wait_for_request(const std::string &method, int timeout_ms, int nth = 1) {
    std::unique_lock<std::mutex> lock(mu_);
    std::optional<clawlink::request_frame> found;
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&]() {
      int seen = 0;
      for (const auto &req : requests_) {
        if (req.method == method && ++seen == nth) {
          found = req;
          return true;
        }
      }
      return false;
    });
    return found;
  }

  int connections() const { return connections_.load(); }
  int upgrades() const { return upgrades_.load(); }

  bool wait_for_upgrades(int count, int timeout_ms) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                        [&]() { return upgrades_.load() >= count; });
  }

private:
  static bool send_all(int fd, const void *data, size_t size) {
    const auto *ptr = static_cast<const uint8_t *>(data);
    size_t sent = 0;
    while (sent < size) {
      ssize_t n = ::send(fd, ptr + sent, size - sent, MSG_NOSIGNAL);
      if (n <= 0)
        return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  void serve() {
    while (running_.load()) {
      pollfd pfd{listen_fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0)
        continue;
      int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0)
        continue;
      connections_.fetch_add(1);
      if (refuse_.load()) {
        ::close(fd);
        continue;
      }
      handle_client(fd);
    }
  }

  void handle_client(int fd) {
    clawlink::plain_stream stream(fd);
    auto head = clawlink::read_http_head(stream, 5000);
    if (!head)
      return;
    auto key = clawlink::http_header(*head, "Sec-WebSocket-Key");
    if (!key)
      return;
    std::string reply = "HTTP/1.1 101 Switching Protocols\r\n"
                        "Upgrade: websocket\r\n"
                        "Connection: Upgrade\r\n"
                        "Sec-WebSocket-Accept: " +
                        clawlink::websocket_accept_key(*key) + "\r\n\r\n";
    if (!stream.write_all(reply.data(), reply.size()))
      return;

    std::optional<std::string> challenge;
    {
      std::lock_guard<std::mutex> lock(send_mu_);
      client_fd_ = fd;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      challenge = challenge_;
      upgrades_.fetch_add(1);
    }
    cv_.notify_all();
    if (challenge)
      send_event("connect.challenge", {{"nonce", *challenge}});

    for (;;) {
      std::optional<clawlink::ws_frame> frame;
      try {
        frame = clawlink::read_ws_frame(stream);
      } catch (const clawlink::protocol_error &) {
        break;
      }
      if (!frame || frame->opcode == clawlink::kOpClose)
        break;
      if (frame->opcode == clawlink::kOpPing) {
        std::lock_guard<std::mutex> lock(send_mu_);
        auto pong = clawlink::encode_ws_frame(clawlink::kOpPong, frame->payload);
        send_all(fd, pong.data(), pong.size());
        continue;
      }
      if (frame->opcode != clawlink::kOpText)
        continue;
      handle_text(frame->payload);
    }

    std::lock_guard<std::mutex> lock(send_mu_);
    client_fd_ = -1;
  }

  void handle_text(const std::string &text) {
    clawlink::gateway_frame frame;
    try {
      frame = clawlink::decode_frame(text);
    } catch (const clawlink::protocol_error &) {
      return;
    }
    auto *req = std::get_if<clawlink::request_frame>(&frame);
    if (req == nullptr)
      return;

    script_fn script;
    {
      std::lock_guard<std::mutex> lock(mu_);
      requests_.push_back(*req);
      script = script_;
    }
    cv_.notify_all();
    if (auto res = script(*this, *req))
      send_response(*res);
  }

  int listen_fd_ = -1;
  int port_ = 0;
  std::thread thread_;
  std::atomic<bool> running_{true};
  std::atomic<bool> refuse_{false};
  std::atomic<int> connections_{0};
  std::atomic<int> upgrades_{0};

  mutable std::mutex mu_;
  std::condition_variable cv_;
  script_fn script_;
  std::optional<std::string> challenge_;
  std::vector<clawlink::request_frame> requests_;

  std::mutex send_mu_;
  int client_fd_ = -1;
};

} // namespace clawlink_test
