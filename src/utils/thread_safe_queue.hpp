#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

template <typename T> class ThreadSafeQueue {
public:
  // Returns false once shutdown has been requested; the value is dropped.
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutdown_requested_)
        return false;
      queue_.push(std::move(value));
    }
    cond_.notify_one();
    return true;
  }

  // A blocking wait_and_pop that returns false on shutdown once drained
  bool wait_and_pop(T &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_; });
    if (shutdown_requested_ && queue_.empty())
      return false;

    value = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  // Wakes all waiters; queued items are still handed out
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_requested_ = true;
    }
    cond_.notify_all();
  }

  // Drops every queued item, returns how many were dropped
  size_t clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = queue_.size();
    std::queue<T>().swap(queue_);
    return dropped;
  }

private:
  std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable cond_;
  bool shutdown_requested_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
