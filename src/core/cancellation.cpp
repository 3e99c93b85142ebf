#include "cintel/core/cancellation.h"

namespace cintel::core {

bool CancellationToken::is_cancelled() const {
  if (!state_) {
    return false;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

void CancellationToken::on_cancel(std::function<void()> hook) const {
  if (!state_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->cancelled) {
      state_->hooks.push_back(std::move(hook));
      return;
    }
  }
  hook();
}

bool CancellationSource::is_cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

void CancellationSource::cancel() {
  std::vector<std::function<void()>> hooks;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
      return;
    }
    state_->cancelled = true;
    hooks.swap(state_->hooks);
  }
  for (const auto& hook : hooks) {
    hook();
  }
}

}  // namespace cintel::core
