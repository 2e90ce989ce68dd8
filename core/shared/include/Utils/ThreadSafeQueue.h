#ifndef DEVICEWATCH_UTILS_THREAD_SAFE_QUEUE_H
#define DEVICEWATCH_UTILS_THREAD_SAFE_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace DeviceWatch {
namespace Utils {

/**
 * @brief Thread-safe queue for producer-consumer patterns.
 * @details With a non-zero capacity the oldest item is dropped when a push
 *          would overflow; dropped items are counted.
 */
template <typename T> class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(size_t capacity = 0) : capacity_(capacity) {}

  // Push a single item
  void push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return;
      if (capacity_ > 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(value));
    }
    cond_.notify_one();
  }

  // Pop a single item (blocking). nullopt once closed and drained.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return !queue_.empty() || closed_; });
    return takeFront();
  }

  // Pop with timeout
  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    return takeFront();
  }

  // Try to pop a single item (non-blocking)
  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return takeFront();
  }

  // Pop multiple items up to max_items (blocking if empty, with optional
  // timeout)
  std::vector<T> pop_batch(size_t max_items, uint32_t timeout_ms = 0) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return !queue_.empty() || closed_; };
    if (timeout_ms > 0) {
      cond_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready);
    } else {
      cond_.wait(lock, ready);
    }

    std::vector<T> batch;
    while (!queue_.empty() && batch.size() < max_items) {
      batch.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
    return batch;
  }

  // Try to pop all current items
  std::vector<T> try_pop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> batch;
    while (!queue_.empty()) {
      batch.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
    return batch;
  }

  // Wakes every blocked consumer; later pushes are ignored
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cond_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

private:
  std::optional<T> takeFront() {
    if (queue_.empty())
      return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  mutable std::mutex mutex_;
  std::deque<T> queue_;
  std::condition_variable cond_;
  size_t capacity_;
  bool closed_ = false;
  uint64_t dropped_ = 0;
};

} // namespace Utils
} // namespace DeviceWatch

#endif // DEVICEWATCH_UTILS_THREAD_SAFE_QUEUE_H
