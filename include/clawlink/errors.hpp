#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace clawlink {

/// Root of every error raised by clawlink.
class gateway_error : public std::runtime_error {
public:
  explicit gateway_error(const std::string &message,
                         std::string code = "GATEWAY_ERROR")
      : std::runtime_error(message), code_(std::move(code)) {}

  const std::string &code() const { return code_; }

private:
  std::string code_;
};

/// Socket-level failure: refused, reset, unexpected EOF, write failure.
class transport_error : public gateway_error {
public:
  explicit transport_error(const std::string &message,
                           std::string code = "TRANSPORT_ERROR")
      : gateway_error(message, std::move(code)) {}
};

class tls_error : public transport_error {
public:
  explicit tls_error(const std::string &message)
      : transport_error(message, "TLS_ERROR") {}
};

/// A request was abandoned because its session went away.
class connection_lost_error : public transport_error {
public:
  explicit connection_lost_error(const std::string &message)
      : transport_error(message, "CONNECTION_LOST") {}
};

class request_timeout_error : public gateway_error {
public:
  request_timeout_error(const std::string &method, int timeout_ms)
      : gateway_error("request '" + method + "' timed out after " +
                          std::to_string(timeout_ms) + " ms",
                      "TIMEOUT"),
        method_(method), timeout_ms_(timeout_ms) {}

  const std::string &method() const { return method_; }
  int timeout_ms() const { return timeout_ms_; }

private:
  std::string method_;
  int timeout_ms_;
};

/// The gateway answered ok:false.
class rpc_error : public gateway_error {
public:
  rpc_error(const std::string &method, const std::string &error_code,
            const std::string &error_message)
      : gateway_error(method + " failed: " +
                          (error_message.empty()
                               ? (error_code.empty() ? "unknown" : error_code)
                               : error_message),
                      "RPC_ERROR"),
        method_(method), error_code_(error_code),
        error_message_(error_message) {}

  const std::string &method() const { return method_; }
  const std::string &error_code() const { return error_code_; }
  const std::string &error_message() const { return error_message_; }

private:
  std::string method_;
  std::string error_code_;
  std::string error_message_;
};

/// The connect request was rejected by the gateway.
class handshake_error : public rpc_error {
public:
  handshake_error(const std::string &error_code,
                  const std::string &error_message, bool pairing_required)
      : rpc_error("connect", error_code, error_message),
        pairing_required_(pairing_required) {}

  bool pairing_required() const { return pairing_required_; }

private:
  bool pairing_required_;
};

class protocol_error : public gateway_error {
public:
  explicit protocol_error(const std::string &message)
      : gateway_error(message, "PROTOCOL_ERROR") {}
};

class identity_error : public gateway_error {
public:
  explicit identity_error(const std::string &message)
      : gateway_error(message, "IDENTITY_ERROR") {}
};

/// Failures the supervisor retries silently without fault reporting.
inline bool is_transient_network_error(const std::exception &error) {
  return dynamic_cast<const transport_error *>(&error) != nullptr ||
         dynamic_cast<const request_timeout_error *>(&error) != nullptr;
}

} // namespace clawlink
