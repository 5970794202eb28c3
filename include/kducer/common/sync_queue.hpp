#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace kducer {

/**
 * @brief Mutex-protected FIFO shared between the session thread and caller threads
 *
 * Any number of threads may push and pop concurrently. Elements leave only through
 * TryPop() or Clear().
 */
template <typename T>
class SyncQueue {
 public:
  SyncQueue() = default;
  SyncQueue(const SyncQueue &) = delete;
  SyncQueue &operator=(const SyncQueue &) = delete;

  void Push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back(std::move(value));
  }

  [[nodiscard]] std::optional<T> TryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
      return {};
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  [[nodiscard]] size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  [[nodiscard]] bool Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::deque<T> items_;
};

}  // namespace kducer
