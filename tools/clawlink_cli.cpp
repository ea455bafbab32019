#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "clawlink/clawlink.hpp"

namespace {

void print_usage() {
  std::fprintf(stderr,
               "usage: clawlink-cli [--host H] [--port P] [--token T] [--tls]\n"
               "                    [--config FILE] [--identity KEY.pem]\n"
               "                    [--message TEXT] [--verbose]\n");
}

bool wait_connected(const clawlink::gateway_client &client, int timeout_ms) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (client.is_connected())
      return true;
    if (client.is_pairing_required())
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return false;
}

/// Prints assistant text as it streams in until the run finishes.
int stream_reply(clawlink::gateway_client &client, const std::string &message) {
  auto chat = client.subscribe_chat();
  auto agent = client.subscribe_agent();

  std::string session_key = client.main_session_key().value_or("main");
  auto run_id = client.send_chat(session_key, message);

  std::string printed;
  for (;;) {
    while (auto ev = agent.try_next()) {
      if (run_id && ev->run_id && *ev->run_id != *run_id)
        continue;
      if (ev->stream != clawlink::agent_stream::assistant || !ev->data ||
          !ev->data->text)
        continue;
      const std::string &text = *ev->data->text;
      // Assistant text arrives as the full answer so far.
      if (text.size() > printed.size() &&
          text.compare(0, printed.size(), printed) == 0) {
        std::fputs(text.c_str() + printed.size(), stdout);
      } else if (text != printed) {
        std::printf("\n%s", text.c_str());
      }
      std::fflush(stdout);
      printed = text;
    }

    auto ev = chat.next(std::chrono::milliseconds(100));
    if (!ev) {
      if (!client.is_connected()) {
        std::fprintf(stderr, "\nconnection lost\n");
        return 1;
      }
      continue;
    }
    if (run_id && ev->run_id && *ev->run_id != *run_id)
      continue;
    if (ev->state == clawlink::chat_state::final) {
      std::printf("\n");
      return 0;
    }
    if (ev->state == clawlink::chat_state::aborted) {
      std::printf("\n[aborted]\n");
      return 1;
    }
    if (ev->state == clawlink::chat_state::error) {
      std::fprintf(stderr, "\nerror: %s\n",
                   ev->error_message.value_or("chat failed").c_str());
      return 1;
    }
  }
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  clawlink::cli_options opts;
  try {
    opts = clawlink::parse_flags(args);
  } catch (const std::exception &e) {
    std::fprintf(stderr, "clawlink-cli: %s\n", e.what());
    print_usage();
    return 2;
  }
  if (opts.verbose)
    clawlink::set_log_level(spdlog::level::debug);

  std::shared_ptr<const clawlink::device_identity> identity;
  if (opts.identity_path) {
    try {
      identity =
          clawlink::device_identity_store(*opts.identity_path).load_or_create();
    } catch (const clawlink::identity_error &e) {
      std::fprintf(stderr, "clawlink-cli: %s\n", e.what());
      return 1;
    }
  }

  std::shared_ptr<clawlink::credential_store> credentials;
  if (opts.config_path) {
    credentials =
        std::make_shared<clawlink::file_credential_store>(*opts.config_path);
  }

  clawlink::client_options client_opts;
  client_opts.auto_fetch_agents = !opts.message;
  clawlink::gateway_client client(client_opts, identity, credentials);

  client.state().watch([](const clawlink::connection_state &state) {
    clawlink::logger()->info("state: {}", clawlink::to_string(state));
  });

  client.connect(opts.host, opts.port, opts.token, opts.use_tls);
  if (!wait_connected(client, 30000)) {
    if (client.is_pairing_required()) {
      std::fprintf(stderr,
                   "device %s is not paired; approve it on the gateway\n",
                   client.device_id().value_or("?").c_str());
    } else {
      std::fprintf(stderr, "could not connect to %s:%d\n", opts.host.c_str(),
                   opts.port);
    }
    client.disconnect();
    return 1;
  }

  int rc = 0;
  try {
    if (opts.message) {
      rc = stream_reply(client, *opts.message);
    } else {
      std::printf("health: %s\n", client.check_health() ? "ok" : "failing");
      auto agents = client.get_agent_list();
      std::printf("default agent: %s\n", agents.default_id.c_str());
      for (const auto &agent : agents.agents)
        std::printf("  %s  %s\n", agent.id.c_str(), agent.name.c_str());
    }
  } catch (const clawlink::gateway_error &e) {
    std::fprintf(stderr, "clawlink-cli: %s\n", e.what());
    rc = 1;
  }

  client.disconnect();
  return rc;
}
