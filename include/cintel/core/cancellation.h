#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace cintel::core {

namespace detail {

struct CancellationState {
  std::mutex mutex;
  bool cancelled{false};
  std::vector<std::function<void()>> hooks;
};

}  // namespace detail

// Observer side of a cancellation. A default-constructed token can never be cancelled.
// Copies share state with the source that issued them.
class CancellationToken {
 public:
  CancellationToken() = default;

  [[nodiscard]] bool is_cancelled() const;

  // Registers a hook run once on cancellation, on the cancelling thread.
  // Runs the hook immediately when cancellation already happened.
  void on_cancel(std::function<void()> hook) const;

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
 public:
  CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

  [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }
  [[nodiscard]] bool is_cancelled() const;

  // Idempotent. Hooks run synchronously before this returns, outside the lock.
  void cancel();

 private:
  std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace cintel::core
