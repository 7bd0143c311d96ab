#include "reload_state.hpp"

void ReloadState::bump() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++version_;
  }
  changed_.notify_all();
}

uint64_t ReloadState::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

std::optional<uint64_t>
ReloadState::wait_for_change(uint64_t last_seen,
                             std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  bool changed = changed_.wait_for(lock, timeout,
                                   [&] { return version_ != last_seen; });
  if (!changed) {
    return std::nullopt;
  }
  return version_;
}
