#ifndef RELOAD_STATE_HPP
#define RELOAD_STATE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

// Monotonic version shared by every reload stream of one server.
class ReloadState {
public:
  ReloadState() = default;
  ReloadState(const ReloadState &) = delete;
  ReloadState &operator=(const ReloadState &) = delete;

  // Increments the version and wakes all waiters.
  void bump();

  uint64_t get() const;

  // Blocks until the version differs from last_seen. Returns std::nullopt
  // when the timeout elapses first.
  std::optional<uint64_t> wait_for_change(uint64_t last_seen,
                                          std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable changed_;
  uint64_t version_ = 0;
};

#endif
