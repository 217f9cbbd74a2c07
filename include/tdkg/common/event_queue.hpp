#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace tdkg {

enum class QueueStatus {
  kItem = 0,
  kClosed = 1,
  kTimedOut = 2,
};

// Unbounded multi-producer, single-consumer FIFO. Push never blocks, so
// producers cannot stall on a consumer that already went away; once closed,
// pushes are rejected and dropped.
template <typename T>
class EventQueue {
 public:
  EventQueue() = default;

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;
  EventQueue(EventQueue&&) = delete;
  EventQueue& operator=(EventQueue&&) = delete;

  bool Push(T item) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  QueueStatus Pop(T* out) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    return TakeLocked(out);
  }

  QueueStatus PopUntil(std::chrono::steady_clock::time_point deadline, T* out) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_until(lock, deadline, [this]() { return closed_ || !queue_.empty(); })) {
      return QueueStatus::kTimedOut;
    }
    return TakeLocked(out);
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
      queue_.clear();
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

 private:
  QueueStatus TakeLocked(T* out) {
    if (queue_.empty()) {
      return QueueStatus::kClosed;
    }
    *out = std::move(queue_.front());
    queue_.pop_front();
    return QueueStatus::kItem;
  }

  std::deque<T> queue_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool closed_ = false;
};

}  // namespace tdkg
