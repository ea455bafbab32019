#pragma once

#include <exception>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

namespace clawlink {

/// Tunables of a gateway_client. Defaults match the gateway's expectations.
struct client_options {
  std::string client_id = "clawlink";
  std::string client_version = "1.0";
  std::string platform = "linux";
  std::string mode = "ui";
  std::string role = "operator";
  std::vector<std::string> scopes = {"operator.admin"};

  int request_timeout_ms = 15000;
  int chat_timeout_ms = 35000;
  int short_timeout_ms = 5000;
  int connect_request_timeout_ms = 8000;
  int socket_connect_timeout_ms = 10000;
  int challenge_timeout_ms = 2000;
  int idle_poll_ms = 250;
  int heartbeat_interval_ms = 25000;

  size_t event_channel_capacity = 64;
  bool auto_fetch_agents = true;
};

/// Persisted secrets the client reads on each connection attempt.
class credential_store {
public:
  virtual ~credential_store() = default;
  virtual std::optional<std::string> token() const = 0;
  /// SHA-256 fingerprint of the gateway's TLS certificate, if pinned.
  virtual std::optional<std::string> tls_pin() const = 0;
};

class static_credential_store : public credential_store {
public:
  static_credential_store(std::optional<std::string> token,
                          std::optional<std::string> tls_pin)
      : token_(std::move(token)), tls_pin_(std::move(tls_pin)) {}

  std::optional<std::string> token() const override { return token_; }
  std::optional<std::string> tls_pin() const override { return tls_pin_; }

private:
  std::optional<std::string> token_;
  std::optional<std::string> tls_pin_;
};

/// Value of a `key: value` line, with optional double quotes removed.
inline std::string config_value(const std::string &line) {
  auto colon = line.find(':');
  if (colon == std::string::npos)
    return "";
  auto val = line.substr(colon + 1);
  auto start = val.find_first_not_of(" \t");
  if (start == std::string::npos)
    return "";
  val = val.substr(start);
  auto end = val.find_last_not_of(" \t\r");
  val = val.substr(0, end + 1);
  if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
    val = val.substr(1, val.size() - 2);
  return val;
}

/// Gateway settings file: `host`, `port`, `tls`, `token`, `tls_pin`.
struct gateway_config {
  std::optional<std::string> host;
  std::optional<int> port;
  std::optional<bool> use_tls;
  std::optional<std::string> token;
  std::optional<std::string> tls_pin;
};

inline gateway_config parse_gateway_config(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    throw std::runtime_error("cannot open: " + path);

  gateway_config cfg;
  std::string line;
  int line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    auto start = line.find_first_not_of(" \t");
    if (start == std::string::npos || line[start] == '#')
      continue;
    line = line.substr(start);

    auto value = config_value(line);
    if (line.find("host:") == 0) {
      cfg.host = value;
    } else if (line.find("port:") == 0) {
      try {
        cfg.port = std::stoi(value);
      } catch (const std::exception &) {
        throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                 ": invalid port '" + value + "'");
      }
    } else if (line.find("tls_pin:") == 0) {
      if (!value.empty())
        cfg.tls_pin = value;
    } else if (line.find("tls:") == 0) {
      cfg.use_tls = value == "true" || value == "yes" || value == "1";
    } else if (line.find("token:") == 0) {
      if (!value.empty())
        cfg.token = value;
    }
  }
  return cfg;
}

/// Credentials from a gateway settings file. Edits on disk take effect
/// after reload().
class file_credential_store : public credential_store {
public:
  explicit file_credential_store(std::string path) : path_(std::move(path)) {
    reload();
  }

  void reload() {
    auto cfg = parse_gateway_config(path_);
    std::lock_guard<std::mutex> lock(mu_);
    cfg_ = std::move(cfg);
  }

  std::optional<std::string> token() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return cfg_.token;
  }

  std::optional<std::string> tls_pin() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return cfg_.tls_pin;
  }

  gateway_config config() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cfg_;
  }

private:
  std::string path_;
  mutable std::mutex mu_;
  gateway_config cfg_;
};

/// Receives connection failures that are not transient network errors.
class fault_reporter {
public:
  virtual ~fault_reporter() = default;
  virtual void record_exception(const std::exception &error) = 0;
};

class logging_fault_reporter : public fault_reporter {
public:
  void record_exception(const std::exception &error) override {
    logger()->error("gateway connection fault: {}", error.what());
  }
};

/// Command-line settings of clawlink-cli.
struct cli_options {
  std::string host = "127.0.0.1";
  int port = kDefaultGatewayPort;
  std::optional<std::string> token;
  bool use_tls = false;
  std::optional<std::string> config_path;
  std::optional<std::string> identity_path;
  std::optional<std::string> message;
  bool verbose = false;
};

/// Parse clawlink-cli flags. A --config file fills in whatever the other
/// flags leave unset. Throws std::invalid_argument on bad input.
inline cli_options parse_flags(const std::vector<std::string> &args) {
  cli_options opts;
  bool host_set = false;
  bool port_set = false;
  bool tls_set = false;

  auto need_value = [&args](size_t i) -> const std::string & {
    if (i + 1 >= args.size())
      throw std::invalid_argument(args[i] + " requires a value");
    return args[i + 1];
  };

  for (size_t i = 0; i < args.size(); ++i) {
    const auto &arg = args[i];
    if (arg == "--host") {
      opts.host = need_value(i++);
      host_set = true;
    } else if (arg == "--port") {
      const auto &text = need_value(i++);
      try {
        opts.port = std::stoi(text);
      } catch (const std::exception &) {
        throw std::invalid_argument("invalid port: " + text);
      }
      if (opts.port <= 0 || opts.port > 65535)
        throw std::invalid_argument("invalid port: " + text);
      port_set = true;
    } else if (arg == "--token") {
      opts.token = need_value(i++);
    } else if (arg == "--tls") {
      opts.use_tls = true;
      tls_set = true;
    } else if (arg == "--config") {
      opts.config_path = need_value(i++);
    } else if (arg == "--identity") {
      opts.identity_path = need_value(i++);
    } else if (arg == "--message") {
      opts.message = need_value(i++);
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else {
      throw std::invalid_argument("unknown flag: " + arg);
    }
  }

  if (opts.config_path) {
    auto cfg = parse_gateway_config(*opts.config_path);
    if (!host_set && cfg.host)
      opts.host = *cfg.host;
    if (!port_set && cfg.port)
      opts.port = *cfg.port;
    if (!tls_set && cfg.use_tls)
      opts.use_tls = *cfg.use_tls;
    if (!opts.token && cfg.token)
      opts.token = cfg.token;
  }
  return opts;
}

} // namespace clawlink
