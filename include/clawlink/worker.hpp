#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

#include "log.hpp"

namespace clawlink {

/// Single background thread running posted tasks in order.
class task_worker {
public:
  using task_fn = std::function<void()>;

  task_worker() : thread_([this]() { run(); }) {}

  ~task_worker() { stop(); }

  task_worker(const task_worker &) = delete;
  task_worker &operator=(const task_worker &) = delete;

  /// Returns false once the worker is stopping.
  bool post(task_fn task) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_)
        return false;
      tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
  }

  /// Drops queued tasks, waits for the running one, joins.
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
      tasks_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
      thread_.join();
  }

private:
  void run() {
    for (;;) {
      task_fn task;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
        if (stopping_)
          return;
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      try {
        task();
      } catch (const std::exception &e) {
        logger()->error("background task failed: {}", e.what());
      }
    }
  }

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<task_fn> tasks_;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace clawlink
