#include "../include/clawlink/supervisor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()> &pred, int timeout_ms) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

class counting_reporter : public clawlink::fault_reporter {
public:
  void record_exception(const std::exception &) override { count.fetch_add(1); }
  std::atomic<int> count{0};
};

/// Stands in for a live session: blocks until dropped or cancelled.
class fake_link {
public:
  void hold(const clawlink::cancel_token &token) {
    std::unique_lock<std::mutex> lock(mu_);
    while (!dropped_ && !token.cancelled())
      cv_.wait_for(lock, 10ms);
    dropped_ = false;
  }

  void drop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      dropped_ = true;
    }
    cv_.notify_all();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool dropped_ = false;
};

clawlink::gateway_endpoint endpoint(const std::string &host) {
  clawlink::gateway_endpoint ep;
  ep.host = host;
  ep.token = std::string("t");
  return ep;
}

} // namespace

int main() {
  int passed = 0;

  // --- backoff ---
  assert(clawlink::backoff_delay_ms(0) == 350);
  ++passed;
  assert(clawlink::backoff_delay_ms(2) == 1011);
  ++passed;
  assert(clawlink::backoff_delay_ms(3) == 1719);
  ++passed;
  for (int i = 0; i < 12; ++i)
    assert(clawlink::backoff_delay_ms(i) <= clawlink::backoff_delay_ms(i + 1));
  ++passed;
  assert(clawlink::backoff_delay_ms(7) == clawlink::kMaxBackoffMs);
  ++passed;
  assert(clawlink::backoff_delay_ms(40) == clawlink::kMaxBackoffMs);
  ++passed;

  // --- endpoint equality ---
  {
    auto a = endpoint("a");
    auto b = endpoint("a");
    assert(a == b);
    b.token = std::string("other");
    assert(a != b);
    b = endpoint("a");
    b.use_tls = true;
    assert(a != b);
    ++passed;
  }

  // --- connect, retarget, disconnect ---
  {
    fake_link link;
    std::atomic<int> calls{0};
    std::mutex hosts_mu;
    std::string last_host;
    auto reporter = std::make_shared<counting_reporter>();

    clawlink::connection_supervisor sup(
        [&](const clawlink::gateway_endpoint &ep,
            const clawlink::cancel_token &token,
            const std::function<void()> &on_connected) {
          calls.fetch_add(1);
          {
            std::lock_guard<std::mutex> lock(hosts_mu);
            last_host = ep.host;
          }
          on_connected();
          link.hold(token);
        },
        [&link]() { link.drop(); }, reporter, 20);

    assert(sup.state().get() == clawlink::connection_state::disconnected);
    ++passed;

    assert(sup.connect(endpoint("a")));
    assert(wait_until(
        [&]() {
          return sup.state().get() == clawlink::connection_state::connected;
        },
        2000));
    ++passed;
    assert(calls.load() == 1);
    ++passed;

    auto gen = sup.generation();
    assert(!sup.connect(endpoint("a")));
    std::this_thread::sleep_for(50ms);
    assert(calls.load() == 1 && sup.generation() == gen);
    ++passed;

    assert(sup.connect(endpoint("b")));
    assert(sup.generation() > gen);
    ++passed;
    assert(wait_until([&]() { return calls.load() == 2; }, 2000));
    assert(wait_until(
        [&]() {
          return sup.state().get() == clawlink::connection_state::connected;
        },
        2000));
    {
      std::lock_guard<std::mutex> lock(hosts_mu);
      assert(last_host == "b");
    }
    assert(sup.desired()->host == "b");
    ++passed;

    // The session ends on its own; the loop reconnects right away.
    link.drop();
    assert(wait_until([&]() { return calls.load() == 3; }, 2000));
    ++passed;

    sup.disconnect();
    assert(sup.state().get() == clawlink::connection_state::disconnected);
    ++passed;
    assert(!sup.desired());
    ++passed;
    int after = calls.load();
    std::this_thread::sleep_for(100ms);
    assert(calls.load() == after);
    ++passed;
    assert(reporter->count.load() == 0);
    ++passed;
  }

  // --- non-transient failures report once per outage ---
  {
    fake_link link;
    std::atomic<int> calls{0};
    auto reporter = std::make_shared<counting_reporter>();

    clawlink::connection_supervisor sup(
        [&](const clawlink::gateway_endpoint &,
            const clawlink::cancel_token &token,
            const std::function<void()> &on_connected) {
          int n = calls.fetch_add(1) + 1;
          if (n == 1 || n == 2)
            throw clawlink::handshake_error("UNAUTHORIZED", "bad token", false);
          if (n == 3) {
            // Usable session that ends immediately.
            on_connected();
            return;
          }
          if (n == 4)
            throw clawlink::handshake_error("UNAUTHORIZED", "bad token", false);
          on_connected();
          link.hold(token);
        },
        [&link]() { link.drop(); }, reporter, 20);

    sup.connect(endpoint("a"));
    assert(wait_until([&]() { return calls.load() >= 2; }, 3000));
    assert(reporter->count.load() == 1);
    ++passed;

    assert(wait_until(
        [&]() {
          return calls.load() >= 5 &&
                 sup.state().get() == clawlink::connection_state::connected;
        },
        6000));
    assert(reporter->count.load() == 2);
    ++passed;
    assert(sup.attempt() == 0);
    ++passed;
    sup.disconnect();
  }

  // --- transient failures are never reported; state says reconnecting ---
  {
    std::atomic<int> calls{0};
    auto reporter = std::make_shared<counting_reporter>();
    clawlink::connection_supervisor sup(
        [&](const clawlink::gateway_endpoint &, const clawlink::cancel_token &,
            const std::function<void()> &) {
          calls.fetch_add(1);
          if (calls.load() % 2 == 0)
            throw clawlink::request_timeout_error("connect", 8000);
          throw clawlink::connection_lost_error("refused");
        },
        nullptr, reporter, 20);

    sup.connect(endpoint("a"));
    assert(wait_until([&]() { return calls.load() >= 2; }, 3000));
    assert(sup.state().get() == clawlink::connection_state::reconnecting);
    ++passed;
    assert(sup.attempt() >= 1);
    ++passed;
    assert(reporter->count.load() == 0);
    ++passed;
    sup.disconnect();
    assert(sup.attempt() == 0);
    ++passed;
  }

  // --- reconnect skips the pending backoff ---
  {
    std::atomic<int> calls{0};
    clawlink::connection_supervisor sup(
        [&](const clawlink::gateway_endpoint &, const clawlink::cancel_token &,
            const std::function<void()> &) {
          calls.fetch_add(1);
          throw clawlink::transport_error("refused");
        },
        nullptr, std::make_shared<counting_reporter>(), 20);

    sup.reconnect();
    std::this_thread::sleep_for(30ms);
    assert(calls.load() == 0);
    ++passed;

    sup.connect(endpoint("a"));
    assert(wait_until([&]() { return calls.load() == 1; }, 2000));
    auto start = std::chrono::steady_clock::now();
    sup.reconnect();
    assert(wait_until([&]() { return calls.load() == 2; }, 2000));
    assert(std::chrono::steady_clock::now() - start < 400ms);
    ++passed;
    sup.disconnect();
  }

  // --- overlapping restarts never run two attempts at once ---
  {
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> calls{0};
    clawlink::connection_supervisor sup(
        [&](const clawlink::gateway_endpoint &,
            const clawlink::cancel_token &token,
            const std::function<void()> &on_connected) {
          calls.fetch_add(1);
          int now = in_flight.fetch_add(1) + 1;
          int seen = max_in_flight.load();
          while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
          }
          on_connected();
          while (!token.cancelled())
            std::this_thread::sleep_for(1ms);
          in_flight.fetch_sub(1);
        },
        nullptr, std::make_shared<counting_reporter>(), 20);

    int restarts = 0;
    assert(sup.connect(endpoint("a")));
    ++restarts;

    constexpr int kReconnectsPerThread = 20;
    auto reconnector = [&sup]() {
      for (int i = 0; i < kReconnectsPerThread; ++i) {
        sup.reconnect();
        std::this_thread::sleep_for(1ms);
      }
    };
    std::thread r1(reconnector);
    std::thread r2(reconnector);
    for (int i = 0; i < 50; ++i) {
      if (sup.connect(endpoint(i % 2 == 0 ? "b" : "a")))
        ++restarts;
      std::this_thread::sleep_for(1ms);
    }
    r1.join();
    r2.join();
    restarts += 2 * kReconnectsPerThread;

    assert(wait_until([&]() { return in_flight.load() == 1; }, 2000));
    assert(max_in_flight.load() == 1);
    ++passed;
    assert(calls.load() >= 1 && calls.load() <= restarts);
    ++passed;

    // One attempt per restart once each restart is allowed to start.
    int before = calls.load();
    for (int i = 0; i < 10; ++i) {
      assert(sup.connect(endpoint(i % 2 == 0 ? "c" : "d")));
      assert(wait_until([&]() { return calls.load() == before + i + 1; },
                        2000));
    }
    std::this_thread::sleep_for(50ms);
    assert(calls.load() == before + 10);
    ++passed;
    assert(max_in_flight.load() == 1);
    ++passed;

    sup.disconnect();
    assert(in_flight.load() == 0);
    ++passed;
  }

  // --- lifecycle calls from the loop thread are rejected ---
  {
    fake_link link;
    std::atomic<bool> rejected{false};
    clawlink::connection_supervisor *self = nullptr;
    clawlink::connection_supervisor sup(
        [&](const clawlink::gateway_endpoint &,
            const clawlink::cancel_token &token,
            const std::function<void()> &on_connected) {
          try {
            self->reconnect();
          } catch (const std::logic_error &) {
            rejected.store(true);
          }
          on_connected();
          link.hold(token);
        },
        [&link]() { link.drop(); }, std::make_shared<counting_reporter>(), 20);
    self = &sup;

    sup.connect(endpoint("a"));
    assert(wait_until([&]() { return rejected.load(); }, 2000));
    ++passed;
    assert(wait_until(
        [&]() {
          return sup.state().get() == clawlink::connection_state::connected;
        },
        2000));
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
