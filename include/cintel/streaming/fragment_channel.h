#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace cintel::streaming {

// Single-producer, single-consumer queue with explicit end of stream.
//
// The producer pushes values and then closes. The consumer pops until nullopt. Cancelling
// (consumer side) drops anything queued, makes further pushes fail and wakes a blocked pop.
template <typename T>
class FragmentChannel {
 public:
  // False when the channel is closed or cancelled; the value is dropped.
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || cancelled_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    ready_.notify_one();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    ready_.notify_all();
  }

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
      queue_.clear();
    }
    ready_.notify_all();
  }

  // Blocks for the next value. nullopt once closed and drained, or cancelled.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return cancelled_ || closed_ || !queue_.empty(); });
    if (cancelled_ || queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  [[nodiscard]] bool is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<T> queue_;
  bool closed_{false};
  bool cancelled_{false};
};

}  // namespace cintel::streaming
