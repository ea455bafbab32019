#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "errors.hpp"
#include "protocol.hpp"

namespace clawlink {

/// Outstanding requests keyed by id. Every entry leaves the table exactly
/// once: resolved by a response, removed on timeout, or failed when the
/// connection goes away.
class pending_table {
public:
  struct pending_call {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    std::optional<rpc_result> result;
    std::string failure;
  };

  /// Registers a new id. Throws std::logic_error if the id is still pending.
  std::shared_ptr<pending_call> add(const std::string &id) {
    auto call = std::make_shared<pending_call>();
    std::lock_guard<std::mutex> lock(mu_);
    if (!pending_.emplace(id, call).second) {
      throw std::logic_error("request id already pending: " + id);
    }
    return call;
  }

  /// Completes the matching entry. Returns false for an orphaned response.
  bool resolve(const response_frame &res) {
    std::shared_ptr<pending_call> call;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = pending_.find(res.id);
      if (it == pending_.end()) {
        return false;
      }
      call = it->second;
      pending_.erase(it);
    }

    std::lock_guard<std::mutex> lock(call->mu);
    call->result = rpc_result::from(res);
    call->done = true;
    call->cv.notify_all();
    return true;
  }

  /// Fails every entry and empties the table in one step.
  size_t fail_all(const std::string &reason) {
    std::unordered_map<std::string, std::shared_ptr<pending_call>> snapshot;
    {
      std::lock_guard<std::mutex> lock(mu_);
      snapshot.swap(pending_);
    }

    for (auto &kv : snapshot) {
      auto &call = kv.second;
      std::lock_guard<std::mutex> lock(call->mu);
      call->done = true;
      call->failure = reason;
      call->cv.notify_all();
    }
    return snapshot.size();
  }

  bool remove(const std::string &id) {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.erase(id) > 0;
  }

  bool contains(const std::string &id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.count(id) > 0;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size();
  }

  /// Blocks until the entry completes or `timeout_ms` passes. Throws
  /// request_timeout_error or connection_lost_error.
  rpc_result wait(const std::string &id,
                  const std::shared_ptr<pending_call> &call,
                  const std::string &method, int timeout_ms) {
    {
      std::unique_lock<std::mutex> lock(call->mu);
      if (call->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [&call]() { return call->done; })) {
        return take(*call);
      }
    }

    if (remove(id)) {
      throw request_timeout_error(method, timeout_ms);
    }
    // Completed between the deadline and the removal.
    std::unique_lock<std::mutex> lock(call->mu);
    call->cv.wait(lock, [&call]() { return call->done; });
    return take(*call);
  }

private:
  static rpc_result take(pending_call &call) {
    if (!call.result) {
      throw connection_lost_error(call.failure.empty() ? "connection lost"
                                                       : call.failure);
    }
    return *call.result;
  }

  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<pending_call>> pending_;
};

} // namespace clawlink
