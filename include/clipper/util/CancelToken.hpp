// Repository: Clipper
// Component: Cancel Token
// Purpose: Cooperative cancellation with an optional deadline, shared between
//          a job and everything it waits on.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_UTIL_CANCEL_TOKEN_HPP_
#define CLIPPER_UTIL_CANCEL_TOKEN_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>

namespace clipper::util {

// Cancel() is a single lock-free store, safe from a signal handler.
// A token may chain to a parent; cancelling the parent cancels every child.
class CancelToken {
 public:
  CancelToken() = default;
  explicit CancelToken(const CancelToken* parent) : parent_(parent) {}

  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void Cancel() { cancelled_.store(true, std::memory_order_release); }

  // Set before the token is shared with other threads.
  void SetDeadline(std::chrono::steady_clock::time_point deadline) {
    deadline_ns_.store(deadline.time_since_epoch().count(), std::memory_order_release);
  }

  void SetTimeout(std::chrono::milliseconds timeout) {
    SetDeadline(std::chrono::steady_clock::now() + timeout);
  }

  bool IsCancelled() const {
    if (cancelled_.load(std::memory_order_acquire)) return true;
    const int64_t deadline = deadline_ns_.load(std::memory_order_acquire);
    if (deadline != kNoDeadline &&
        std::chrono::steady_clock::now().time_since_epoch().count() >= deadline) {
      return true;
    }
    return parent_ != nullptr && parent_->IsCancelled();
  }

  bool DeadlineExpired() const {
    const int64_t deadline = deadline_ns_.load(std::memory_order_acquire);
    return deadline != kNoDeadline &&
           std::chrono::steady_clock::now().time_since_epoch().count() >= deadline;
  }

 private:
  static constexpr int64_t kNoDeadline = INT64_MAX;

  std::atomic<bool> cancelled_{false};
  std::atomic<int64_t> deadline_ns_{kNoDeadline};
  const CancelToken* parent_ = nullptr;
};

}  // namespace clipper::util

#endif  // CLIPPER_UTIL_CANCEL_TOKEN_HPP_
