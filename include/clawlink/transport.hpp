#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <optional>
#include <poll.h>
#include <random>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "encoding.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace clawlink {

constexpr uint8_t kOpContinuation = 0x0;
constexpr uint8_t kOpText = 0x1;
constexpr uint8_t kOpBinary = 0x2;
constexpr uint8_t kOpClose = 0x8;
constexpr uint8_t kOpPing = 0x9;
constexpr uint8_t kOpPong = 0xA;

constexpr uint64_t kMaxFramePayload = 16u * 1024u * 1024u;
constexpr size_t kMaxUpgradeResponse = 16384;
constexpr const char *kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

inline int64_t steady_now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

/// Lowercase hex with separators and whitespace removed.
inline std::string normalize_fingerprint(std::string_view fingerprint) {
  std::string out;
  for (char c : fingerprint) {
    if (c == ':' || std::isspace(static_cast<unsigned char>(c)))
      continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

inline std::string openssl_error_string() {
  unsigned long code = ERR_get_error();
  if (code == 0)
    return "unknown TLS error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

/// Sec-WebSocket-Accept for a given Sec-WebSocket-Key (RFC 6455 4.2.2).
inline std::string websocket_accept_key(const std::string &key) {
  std::string input = key + kWebSocketGuid;
  uint8_t digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &len, EVP_sha1(),
                 nullptr) != 1) {
    throw std::runtime_error("sha1 digest failed");
  }
  return base64_encode(digest, len);
}

// --- byte streams ---

class byte_stream {
public:
  static constexpr ssize_t kTimedOut = -2;

  virtual ~byte_stream() = default;

  /// Returns bytes read, 0 on orderly EOF, -1 on error, kTimedOut when a
  /// read timeout is set and expires.
  virtual ssize_t read_some(void *data, size_t size) = 0;
  virtual bool write_all(const void *data, size_t size) = 0;
  /// Unblocks a reader on another thread.
  virtual void shutdown() = 0;
  /// 0 disables the timeout.
  virtual void set_read_timeout(int timeout_ms) = 0;

  bool read_exact(void *data, size_t size) {
    auto *ptr = static_cast<uint8_t *>(data);
    size_t got = 0;
    while (got < size) {
      ssize_t n = read_some(ptr + got, size - got);
      if (n <= 0) {
        return false;
      }
      got += static_cast<size_t>(n);
    }
    return true;
  }
};

class plain_stream : public byte_stream {
public:
  explicit plain_stream(int fd) : fd_(fd) {}
  ~plain_stream() override {
    if (fd_ >= 0)
      ::close(fd_);
  }

  ssize_t read_some(void *data, size_t size) override {
    for (;;) {
      ssize_t n = ::recv(fd_, data, size, 0);
      if (n < 0 && errno == EINTR)
        continue;
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        return kTimedOut;
      return n;
    }
  }

  bool write_all(const void *data, size_t size) override {
    const auto *ptr = static_cast<const uint8_t *>(data);
    size_t sent = 0;
    while (sent < size) {
      ssize_t n = ::send(fd_, ptr + sent, size - sent, MSG_NOSIGNAL);
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0) {
        return false;
      }
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  void shutdown() override { ::shutdown(fd_, SHUT_RDWR); }

  void set_read_timeout(int timeout_ms) override {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }

private:
  int fd_;
};

/// TLS over a non-blocking socket. SSL calls are serialized by an internal
/// mutex that is released while waiting for readiness, so one reader and
/// one writer can share the connection.
class tls_stream : public byte_stream {
public:
  tls_stream(int fd, const std::string &host,
             const std::optional<std::string> &pin, int timeout_ms,
             const std::function<bool()> &cancelled = {})
      : fd_(fd) {
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (ctx_ == nullptr) {
      ::close(fd_);
      throw tls_error("SSL_CTX_new failed: " + openssl_error_string());
    }
    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    if (pin) {
      // Pinned certificates are checked by fingerprint after the handshake.
      SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
    } else {
      SSL_CTX_set_default_verify_paths(ctx_);
      SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    }

    ssl_ = SSL_new(ctx_);
    if (ssl_ == nullptr) {
      release();
      throw tls_error("SSL_new failed: " + openssl_error_string());
    }
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, host.c_str());
    if (!pin) {
      SSL_set1_host(ssl_, host.c_str());
    }

    int flags = ::fcntl(fd_, F_GETFL, 0);
    ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

    int64_t deadline = steady_now_ms() + timeout_ms;
    for (;;) {
      int rc = SSL_connect(ssl_);
      if (rc == 1)
        break;
      int err = SSL_get_error(ssl_, rc);
      int remaining = static_cast<int>(deadline - steady_now_ms());
      bool stop = cancelled && cancelled();
      if ((err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) &&
          remaining > 0 && !stop) {
        wait_ready(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT,
                   std::min(remaining, 100));
        continue;
      }
      std::string reason = stop             ? std::string("cancelled")
                           : remaining <= 0 ? std::string("timed out")
                                            : openssl_error_string();
      release();
      throw tls_error("TLS handshake with " + host + " failed: " + reason);
    }

    if (pin) {
      verify_pin(*pin);
    }
  }

  ~tls_stream() override { release(); }

  ssize_t read_some(void *data, size_t size) override {
    int64_t waited_ms = 0;
    for (;;) {
      int err = 0;
      {
        std::lock_guard<std::mutex> lock(ssl_mu_);
        if (ssl_ == nullptr)
          return -1;
        int n = SSL_read(ssl_, data, static_cast<int>(size));
        if (n > 0)
          return n;
        err = SSL_get_error(ssl_, n);
      }
      if (err == SSL_ERROR_ZERO_RETURN)
        return 0;
      if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE)
        return -1;
      if (shutting_down_.load())
        return -1;
      int64_t timeout = read_timeout_ms_.load();
      if (timeout > 0) {
        if (waited_ms >= timeout)
          return kTimedOut;
        waited_ms += 50;
        wait_ready(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, 50);
      } else {
        wait_ready(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, 250);
      }
    }
  }

  bool write_all(const void *data, size_t size) override {
    const auto *ptr = static_cast<const uint8_t *>(data);
    size_t sent = 0;
    while (sent < size) {
      int err = 0;
      {
        std::lock_guard<std::mutex> lock(ssl_mu_);
        if (ssl_ == nullptr)
          return false;
        int n = SSL_write(ssl_, ptr + sent, static_cast<int>(size - sent));
        if (n > 0) {
          sent += static_cast<size_t>(n);
          continue;
        }
        err = SSL_get_error(ssl_, n);
      }
      if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE)
        return false;
      if (shutting_down_.load())
        return false;
      wait_ready(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, 250);
    }
    return true;
  }

  void shutdown() override {
    shutting_down_.store(true);
    ::shutdown(fd_, SHUT_RDWR);
  }

  void set_read_timeout(int timeout_ms) override {
    read_timeout_ms_.store(timeout_ms);
  }

private:
  void wait_ready(short events, int timeout_ms) {
    pollfd pfd{fd_, events, 0};
    ::poll(&pfd, 1, timeout_ms);
  }

  void verify_pin(const std::string &pin) {
    X509 *cert = SSL_get_peer_certificate(ssl_);
    if (cert == nullptr) {
      release();
      throw tls_error("server presented no certificate");
    }
    uint8_t digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    int ok = X509_digest(cert, EVP_sha256(), digest, &len);
    X509_free(cert);
    if (ok != 1) {
      release();
      throw tls_error("cannot fingerprint server certificate");
    }
    std::string actual = to_hex(digest, len);
    std::string expected = normalize_fingerprint(pin);
    if (actual != expected) {
      logger()->error("TLS fingerprint mismatch: expected {}, got {}",
                      expected, actual);
      release();
      throw tls_error("server certificate fingerprint mismatch");
    }
    logger()->debug("TLS fingerprint matched {}", actual);
  }

  void release() {
    std::lock_guard<std::mutex> lock(ssl_mu_);
    if (ssl_ != nullptr) {
      SSL_free(ssl_);
      ssl_ = nullptr;
    }
    if (ctx_ != nullptr) {
      SSL_CTX_free(ctx_);
      ctx_ = nullptr;
    }
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd_;
  SSL_CTX *ctx_ = nullptr;
  SSL *ssl_ = nullptr;
  std::mutex ssl_mu_;
  std::atomic<bool> shutting_down_{false};
  std::atomic<int64_t> read_timeout_ms_{0};
};

// --- frame codec ---

struct ws_frame {
  bool fin = true;
  uint8_t opcode = kOpText;
  std::string payload;
};

/// Encode one frame. Clients mask, servers do not.
inline std::vector<uint8_t> encode_ws_frame(uint8_t opcode,
                                            std::string_view payload,
                                            const uint8_t *mask = nullptr) {
  std::vector<uint8_t> frame;
  frame.reserve(payload.size() + 16);
  frame.push_back(static_cast<uint8_t>(0x80 | (opcode & 0x0F)));

  const uint8_t mask_bit = mask != nullptr ? 0x80 : 0x00;
  uint64_t len = payload.size();
  if (len < 126) {
    frame.push_back(static_cast<uint8_t>(mask_bit | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(static_cast<uint8_t>(mask_bit | 126));
    frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    frame.push_back(static_cast<uint8_t>(len & 0xFF));
  } else {
    frame.push_back(static_cast<uint8_t>(mask_bit | 127));
    for (int i = 7; i >= 0; --i) {
      frame.push_back(static_cast<uint8_t>((len >> (i * 8)) & 0xFF));
    }
  }

  if (mask != nullptr) {
    frame.insert(frame.end(), mask, mask + 4);
    for (size_t i = 0; i < payload.size(); ++i) {
      frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
    }
  } else {
    frame.insert(frame.end(), payload.begin(), payload.end());
  }
  return frame;
}

/// Read one raw frame. Returns nothing on EOF; throws protocol_error for an
/// oversized frame.
inline std::optional<ws_frame> read_ws_frame(byte_stream &stream) {
  uint8_t header[2];
  if (!stream.read_exact(header, 2)) {
    return std::nullopt;
  }

  ws_frame frame;
  frame.fin = (header[0] & 0x80) != 0;
  frame.opcode = static_cast<uint8_t>(header[0] & 0x0F);
  bool masked = (header[1] & 0x80) != 0;
  uint64_t len = static_cast<uint64_t>(header[1] & 0x7F);

  if (len == 126) {
    uint8_t ext[2];
    if (!stream.read_exact(ext, 2)) {
      return std::nullopt;
    }
    len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
  } else if (len == 127) {
    uint8_t ext[8];
    if (!stream.read_exact(ext, 8)) {
      return std::nullopt;
    }
    len = 0;
    for (int i = 0; i < 8; ++i) {
      len = (len << 8) | ext[i];
    }
  }
  if (len > kMaxFramePayload) {
    throw protocol_error("websocket frame of " + std::to_string(len) +
                         " bytes exceeds limit");
  }

  std::array<uint8_t, 4> mask{};
  if (masked && !stream.read_exact(mask.data(), mask.size())) {
    return std::nullopt;
  }

  frame.payload.assign(len, '\0');
  if (len > 0 && !stream.read_exact(frame.payload.data(), len)) {
    return std::nullopt;
  }
  if (masked) {
    for (size_t i = 0; i < frame.payload.size(); ++i) {
      frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
    }
  }
  return frame;
}

/// Read an HTTP header block up to and including the blank line. Gives up
/// after `timeout_ms` or once `cancelled` returns true.
inline std::optional<std::string>
read_http_head(byte_stream &stream, int timeout_ms,
               const std::function<bool()> &cancelled = {}) {
  std::string head;
  head.reserve(1024);
  char ch = 0;
  int64_t deadline = steady_now_ms() + timeout_ms;
  stream.set_read_timeout(100);
  while (head.find("\r\n\r\n") == std::string::npos) {
    ssize_t n = stream.read_some(&ch, 1);
    if (n == byte_stream::kTimedOut) {
      if (steady_now_ms() >= deadline || (cancelled && cancelled())) {
        stream.set_read_timeout(0);
        return std::nullopt;
      }
      continue;
    }
    if (n <= 0) {
      stream.set_read_timeout(0);
      return std::nullopt;
    }
    head.push_back(ch);
    if (head.size() > kMaxUpgradeResponse) {
      throw protocol_error("websocket handshake too large");
    }
  }
  stream.set_read_timeout(0);
  return head;
}

/// Case-insensitive header lookup in a raw header block.
inline std::optional<std::string> http_header(const std::string &head,
                                              std::string_view name) {
  size_t pos = head.find("\r\n");
  while (pos != std::string::npos && pos + 2 < head.size()) {
    size_t start = pos + 2;
    size_t end = head.find("\r\n", start);
    if (end == std::string::npos || end == start)
      break;
    std::string line = head.substr(start, end - start);
    auto colon = line.find(':');
    if (colon != std::string::npos && colon == name.size()) {
      bool match = true;
      for (size_t i = 0; i < colon; ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) !=
            std::tolower(static_cast<unsigned char>(name[i]))) {
          match = false;
          break;
        }
      }
      if (match) {
        auto value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t");
        return first == std::string::npos
                   ? std::string()
                   : value.substr(first, last - first + 1);
      }
    }
    pos = end;
  }
  return std::nullopt;
}

// --- tcp ---

/// Resolve and connect, bounded by `timeout_ms` per address.
inline int dial_tcp(const std::string &host, int port, int timeout_ms,
                    const std::function<bool()> &cancelled = {}) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = nullptr;
  std::string port_text = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), port_text.c_str(), &hints, &results);
  if (rc != 0) {
    throw transport_error("cannot resolve " + host + ": " +
                          ::gai_strerror(rc));
  }

  std::string last_error = "no usable address";
  for (addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int res = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (res != 0 && errno == EINPROGRESS) {
      int64_t deadline = steady_now_ms() + timeout_ms;
      pollfd pfd{fd, POLLOUT, 0};
      do {
        if (cancelled && cancelled()) {
          ::close(fd);
          ::freeaddrinfo(results);
          throw transport_error("connect to " + host + " cancelled");
        }
        int slice = static_cast<int>(
            std::min<int64_t>(100, deadline - steady_now_ms()));
        res = ::poll(&pfd, 1, std::max(slice, 0));
      } while (res == 0 && steady_now_ms() < deadline);
      if (res == 0) {
        ::close(fd);
        last_error = "connect timed out";
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      if (res < 0 || so_error != 0) {
        last_error = std::strerror(res < 0 ? errno : so_error);
        ::close(fd);
        continue;
      }
    } else if (res != 0) {
      last_error = std::strerror(errno);
      ::close(fd);
      continue;
    }

    ::fcntl(fd, F_SETFL, flags);
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    ::freeaddrinfo(results);
    return fd;
  }

  ::freeaddrinfo(results);
  throw transport_error("cannot connect to " + host + ":" + port_text + ": " +
                        last_error);
}

// --- websocket client connection ---

struct websocket_options {
  std::string host;
  int port = 0;
  bool use_tls = false;
  std::string path = "/";
  int connect_timeout_ms = 10000;
  std::optional<std::string> tls_pin;
  /// Polled while connecting; true aborts the attempt.
  std::function<bool()> cancelled;
};

inline std::string websocket_url(const websocket_options &opts) {
  return std::string(opts.use_tls ? "wss" : "ws") + "://" + opts.host + ":" +
         std::to_string(opts.port);
}

/// One client WebSocket. Writes are serialized by a single lock; one
/// thread reads at a time.
class websocket_connection {
public:
  explicit websocket_connection(std::unique_ptr<byte_stream> stream)
      : stream_(std::move(stream)), last_activity_ms_(steady_now_ms()) {}

  static std::unique_ptr<websocket_connection>
  open(const websocket_options &opts) {
    int fd = dial_tcp(opts.host, opts.port, opts.connect_timeout_ms,
                      opts.cancelled);
    std::unique_ptr<byte_stream> stream;
    if (opts.use_tls) {
      stream = std::make_unique<tls_stream>(fd, opts.host, opts.tls_pin,
                                            opts.connect_timeout_ms,
                                            opts.cancelled);
    } else {
      stream = std::make_unique<plain_stream>(fd);
    }
    auto conn = std::make_unique<websocket_connection>(std::move(stream));
    conn->upgrade(opts);
    return conn;
  }

  void send_text(std::string_view text) {
    if (!send_frame(kOpText, text)) {
      throw transport_error("websocket send failed");
    }
  }

  bool send_ping() { return send_frame(kOpPing, ""); }

  /// Next complete text message, or nothing once the peer closes or the
  /// socket fails.
  std::optional<std::string> read_text() {
    std::string fragmented;
    bool reading_fragment = false;

    for (;;) {
      auto frame = read_ws_frame(*stream_);
      if (!frame) {
        return std::nullopt;
      }
      last_activity_ms_.store(steady_now_ms());

      switch (frame->opcode) {
      case kOpClose:
        (void)send_frame(kOpClose, frame->payload.substr(0, 2));
        return std::nullopt;
      case kOpPing:
        if (!send_frame(kOpPong, frame->payload)) {
          return std::nullopt;
        }
        continue;
      case kOpPong:
        continue;
      case kOpText:
      case kOpContinuation:
        if (frame->opcode == kOpText && !reading_fragment) {
          fragmented.clear();
        }
        fragmented.append(frame->payload);
        if (fragmented.size() > kMaxFramePayload) {
          throw protocol_error("websocket message exceeds limit");
        }
        reading_fragment = !frame->fin;
        if (frame->fin) {
          return fragmented;
        }
        continue;
      default:
        logger()->debug("ignoring websocket opcode {}", frame->opcode);
        continue;
      }
    }
  }

  /// Best-effort close frame (1000) followed by socket shutdown. The close
  /// frame is skipped when another writer holds the send lock; the shutdown
  /// is what unblocks that writer.
  void close() {
    if (closing_.exchange(true))
      return;
    {
      std::unique_lock<std::mutex> lock(send_mu_, std::try_to_lock);
      if (lock.owns_lock()) {
        const char code[2] = {static_cast<char>(0x03),
                              static_cast<char>(0xE8)};
        (void)write_frame_locked(kOpClose, std::string_view(code, 2));
      }
    }
    stream_->shutdown();
  }

  /// Unblock the reader without a close handshake.
  void abort() {
    closing_.store(true);
    stream_->shutdown();
  }

  int64_t last_activity_ms() const { return last_activity_ms_.load(); }

private:
  bool send_frame(uint8_t opcode, std::string_view payload) {
    std::lock_guard<std::mutex> lock(send_mu_);
    return write_frame_locked(opcode, payload);
  }

  // Caller holds send_mu_.
  bool write_frame_locked(uint8_t opcode, std::string_view payload) {
    std::array<uint8_t, 4> mask{};
    uint32_t bits = static_cast<uint32_t>(random_device_());
    for (size_t i = 0; i < mask.size(); ++i) {
      mask[i] = static_cast<uint8_t>(bits >> (i * 8));
    }
    auto frame = encode_ws_frame(opcode, payload, mask.data());
    return stream_->write_all(frame.data(), frame.size());
  }

  void upgrade(const websocket_options &opts) {
    uint8_t nonce[16];
    for (auto &b : nonce) {
      b = static_cast<uint8_t>(random_device_());
    }
    std::string key = base64_encode(nonce, sizeof(nonce));

    std::string req = "GET " + (opts.path.empty() ? "/" : opts.path) +
                      " HTTP/1.1\r\n";
    req += "Host: " + opts.host + ":" + std::to_string(opts.port) + "\r\n";
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: " + key + "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n\r\n";

    if (!stream_->write_all(req.data(), req.size())) {
      throw transport_error("websocket upgrade request failed");
    }

    auto head =
        read_http_head(*stream_, opts.connect_timeout_ms, opts.cancelled);
    if (!head) {
      throw transport_error("no websocket upgrade response from " +
                            websocket_url(opts));
    }
    auto status_end = head->find("\r\n");
    std::string status = head->substr(0, status_end);
    if (status.find(" 101") == std::string::npos) {
      throw protocol_error("websocket upgrade rejected: " + status);
    }
    auto accept = http_header(*head, "Sec-WebSocket-Accept");
    if (!accept || *accept != websocket_accept_key(key)) {
      throw protocol_error("invalid Sec-WebSocket-Accept from server");
    }
  }

  std::unique_ptr<byte_stream> stream_;
  std::mutex send_mu_;
  std::random_device random_device_;
  std::atomic<int64_t> last_activity_ms_;
  std::atomic<bool> closing_{false};
};

} // namespace clawlink
