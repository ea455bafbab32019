#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace clawlink {

/// Thread-safe single value with change notification. Watchers run on the
/// writer's thread, outside the cell's lock.
template <typename T> class state_cell {
public:
  using watcher_fn = std::function<void(const T &)>;

  explicit state_cell(T initial = T{}) : value_(std::move(initial)) {}

  T get() const {
    std::lock_guard<std::mutex> lock(mu_);
    return value_;
  }

  /// Returns true if the value changed.
  bool set(T value) {
    std::vector<watcher_fn> to_notify;
    std::optional<T> snapshot;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (value_ == value)
        return false;
      value_ = std::move(value);
      if (watchers_.empty())
        return true;
      snapshot = value_;
      for (auto &kv : watchers_)
        to_notify.push_back(kv.second);
    }
    for (auto &fn : to_notify)
      fn(*snapshot);
    return true;
  }

  uint64_t watch(watcher_fn fn) const {
    std::lock_guard<std::mutex> lock(mu_);
    uint64_t id = ++next_watch_id_;
    watchers_[id] = std::move(fn);
    return id;
  }

  void unwatch(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    watchers_.erase(id);
  }

private:
  mutable std::mutex mu_;
  T value_;
  mutable std::map<uint64_t, watcher_fn> watchers_;
  mutable uint64_t next_watch_id_ = 0;
};

/// Multi-subscriber event fan-out. Each subscription owns a bounded queue;
/// when it is full the oldest event is discarded, so a slow subscriber
/// misses events instead of blocking the producer.
template <typename T> class broadcast_channel {
  struct queue_state {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<T> items;
    size_t capacity;
    uint64_t dropped = 0;
    bool closed = false;

    explicit queue_state(size_t cap) : capacity(cap == 0 ? 1 : cap) {}
  };

  struct registry {
    std::mutex mu;
    std::vector<std::shared_ptr<queue_state>> queues;

    void attach(const std::shared_ptr<queue_state> &q) {
      std::lock_guard<std::mutex> lock(mu);
      queues.push_back(q);
    }

    void detach(const std::shared_ptr<queue_state> &q) {
      std::lock_guard<std::mutex> lock(mu);
      for (auto it = queues.begin(); it != queues.end(); ++it) {
        if (*it == q) {
          queues.erase(it);
          break;
        }
      }
    }

    std::vector<std::shared_ptr<queue_state>> snapshot() {
      std::lock_guard<std::mutex> lock(mu);
      return queues;
    }

    void close_all() {
      for (auto &q : snapshot()) {
        {
          std::lock_guard<std::mutex> lock(q->mu);
          q->closed = true;
        }
        q->cv.notify_all();
      }
    }
  };

public:
  class subscription {
  public:
    subscription() = default;
    subscription(const subscription &) = delete;
    subscription &operator=(const subscription &) = delete;
    subscription(subscription &&) noexcept = default;
    subscription &operator=(subscription &&other) noexcept {
      if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        owner_ = std::move(other.owner_);
      }
      return *this;
    }
    ~subscription() { reset(); }

    /// Wait up to `timeout` for the next event.
    std::optional<T> next(std::chrono::milliseconds timeout) {
      if (!state_)
        return std::nullopt;
      std::unique_lock<std::mutex> lock(state_->mu);
      state_->cv.wait_for(lock, timeout, [this]() {
        return !state_->items.empty() || state_->closed;
      });
      return pop_locked();
    }

    std::optional<T> try_next() {
      if (!state_)
        return std::nullopt;
      std::lock_guard<std::mutex> lock(state_->mu);
      return pop_locked();
    }

    uint64_t dropped() const {
      if (!state_)
        return 0;
      std::lock_guard<std::mutex> lock(state_->mu);
      return state_->dropped;
    }

    size_t pending() const {
      if (!state_)
        return 0;
      std::lock_guard<std::mutex> lock(state_->mu);
      return state_->items.size();
    }

    void reset() {
      if (auto owner = owner_.lock())
        owner->detach(state_);
      state_.reset();
      owner_.reset();
    }

  private:
    friend class broadcast_channel;

    std::optional<T> pop_locked() {
      if (state_->items.empty())
        return std::nullopt;
      T item = std::move(state_->items.front());
      state_->items.pop_front();
      return item;
    }

    std::shared_ptr<queue_state> state_;
    std::weak_ptr<registry> owner_;
  };

  explicit broadcast_channel(size_t capacity = 64)
      : capacity_(capacity), registry_(std::make_shared<registry>()) {}

  ~broadcast_channel() { registry_->close_all(); }

  broadcast_channel(const broadcast_channel &) = delete;
  broadcast_channel &operator=(const broadcast_channel &) = delete;

  subscription subscribe() {
    subscription sub;
    sub.state_ = std::make_shared<queue_state>(capacity_);
    sub.owner_ = registry_;
    registry_->attach(sub.state_);
    return sub;
  }

  /// Deliver to every live subscription. Never blocks on consumers.
  void publish(const T &item) {
    for (auto &q : registry_->snapshot()) {
      {
        std::lock_guard<std::mutex> lock(q->mu);
        if (q->closed)
          continue;
        if (q->items.size() >= q->capacity) {
          q->items.pop_front();
          ++q->dropped;
        }
        q->items.push_back(item);
      }
      q->cv.notify_one();
    }
  }

  size_t subscriber_count() const { return registry_->snapshot().size(); }

private:
  size_t capacity_;
  std::shared_ptr<registry> registry_;
};

} // namespace clawlink
