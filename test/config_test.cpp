#include "../include/clawlink/config.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

std::string make_temp_config_path() {
  char tmpl[] = "/tmp/clawlink_config_test_XXXXXX";
  int fd = ::mkstemp(tmpl);
  assert(fd >= 0);
  ::close(fd);
  std::string path = std::string(tmpl) + ".conf";
  std::remove(tmpl);
  return path;
}

} // namespace

int main() {
  int passed = 0;

  // --- defaults ---
  {
    clawlink::client_options opts;
    assert(opts.request_timeout_ms == 15000);
    ++passed;
    assert(opts.chat_timeout_ms == 35000);
    ++passed;
    assert(opts.challenge_timeout_ms == 2000);
    ++passed;
    assert(opts.role == "operator");
    ++passed;
  }

  // --- config_value ---
  assert(clawlink::config_value("token: \"abc\"") == "abc");
  ++passed;
  assert(clawlink::config_value("host: gw.local  ") == "gw.local");
  ++passed;
  assert(clawlink::config_value("empty:") == "");
  ++passed;
  assert(clawlink::config_value("no colon") == "");
  ++passed;

  // --- parse_flags ---
  {
    auto opts = clawlink::parse_flags({});
    assert(opts.host == "127.0.0.1");
    ++passed;
    assert(opts.port == clawlink::kDefaultGatewayPort);
    ++passed;
    assert(!opts.token && !opts.use_tls && !opts.verbose);
    ++passed;

    opts = clawlink::parse_flags({"--host", "gw", "--port", "9000", "--token",
                                  "t", "--tls", "--message", "hi", "-v"});
    assert(opts.host == "gw" && opts.port == 9000);
    ++passed;
    assert(opts.token == std::string("t"));
    ++passed;
    assert(opts.use_tls && opts.verbose);
    ++passed;
    assert(opts.message == std::string("hi"));
    ++passed;
  }

  // --- parse_flags errors ---
  try {
    (void)clawlink::parse_flags({"--port", "nope"});
    assert(false && "bad port should throw");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  try {
    (void)clawlink::parse_flags({"--port", "70000"});
    assert(false && "out of range port should throw");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  try {
    (void)clawlink::parse_flags({"--host"});
    assert(false && "missing value should throw");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  try {
    (void)clawlink::parse_flags({"--listen", "x"});
    assert(false && "unknown flag should throw");
  } catch (const std::invalid_argument &) {
    ++passed;
  }

  // --- config file ---
  {
    std::string path = make_temp_config_path();
    {
      std::ofstream f(path);
      f << "# gateway\n"
        << "host: \"gw.example\"\n"
        << "port: 443\n"
        << "tls: true\n"
        << "token: secret\n"
        << "tls_pin: \"AB:CD:EF\"\n";
    }

    auto cfg = clawlink::parse_gateway_config(path);
    assert(cfg.host == std::string("gw.example"));
    ++passed;
    assert(cfg.port == 443);
    ++passed;
    assert(cfg.use_tls == true);
    ++passed;
    assert(cfg.token == std::string("secret"));
    ++passed;
    assert(cfg.tls_pin == std::string("AB:CD:EF"));
    ++passed;

    clawlink::file_credential_store store(path);
    assert(store.token() == std::string("secret"));
    ++passed;
    assert(store.tls_pin() == std::string("AB:CD:EF"));
    ++passed;

    // Flags win over the file.
    auto opts = clawlink::parse_flags({"--config", path, "--port", "8443"});
    assert(opts.host == "gw.example");
    ++passed;
    assert(opts.port == 8443);
    ++passed;
    assert(opts.use_tls);
    ++passed;
    assert(opts.token == std::string("secret"));
    ++passed;

    {
      std::ofstream f(path);
      f << "token: rotated\n";
    }
    store.reload();
    assert(store.token() == std::string("rotated"));
    ++passed;
    assert(!store.tls_pin());
    ++passed;
    std::remove(path.c_str());
  }

  // --- invalid config ---
  {
    std::string path = make_temp_config_path();
    {
      std::ofstream f(path);
      f << "port: abc\n";
    }
    try {
      (void)clawlink::parse_gateway_config(path);
      assert(false && "bad port should throw");
    } catch (const std::runtime_error &e) {
      assert(std::string(e.what()).find("invalid port") != std::string::npos);
      ++passed;
    }
    std::remove(path.c_str());

    try {
      (void)clawlink::parse_gateway_config("/nonexistent/clawlink.conf");
      assert(false && "missing file should throw");
    } catch (const std::runtime_error &) {
      ++passed;
    }
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
