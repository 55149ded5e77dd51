#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

#include "core/config.hpp" // For DropPolicy

/*
    Bounded queue between two stages: capacity, drop policy for non-blocking pushes, a waiting push for producers
    that must not lose items, timed pop, and close() so the consumer can tell "nothing yet" from "nothing ever again".
*/

namespace pcc {

template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity, DropPolicy policy): capacity_(capacity), policy_(policy) {}

  // No copy/move
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Never blocks. When full, the drop policy decides who loses. Always false once closed
  bool try_push(T item) {
    std::unique_lock<std::mutex> lock(mu_);

    if (closed_) return false;
    ++pushes_;

    if (capacity_ == 0) {
      ++drops_;
      return false;
    }

    if (q_.size() >= capacity_) {
      if (policy_ == DropPolicy::DropNewest) {
        ++drops_;
        return false;
      }
      // DropOldest: remove one oldest element, then accept new one
      q_.pop_front();
      ++drops_;
    }

    q_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Waits up to 'timeout' for free space instead of dropping. False on timeout or when closed, item untouched
  template <typename Rep, typename Period>
  bool push_for(T& item, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!not_full_.wait_for(lock, timeout, [&] { return closed_ || q_.size() < capacity_; })) return false;
    if (closed_) return false;

    ++pushes_;
    q_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool try_pop(T& out) {
    std::unique_lock<std::mutex> lock(mu_);

    if (q_.empty()) return false;

    out = std::move(q_.front());
    q_.pop_front();

    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  // Timeout variant of pop. Returns early with false when the queue is closed and drained
  template <typename Rep, typename Period>
  bool try_pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!not_empty_.wait_for(lock, timeout, [&] { return closed_ || !q_.empty(); })) return false;
    if (q_.empty()) return false;

    out = std::move(q_.front());
    q_.pop_front();

    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  // Producer is done. Items already queued can still be popped
  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  // Closed and nothing left, the consumer can finish
  bool drained() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_ && q_.empty();
  }

  // Getters

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

  std::uint64_t pushes_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pushes_;
  }

  std::uint64_t drops_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return drops_;
  }

private:
  const std::size_t capacity_;
  const DropPolicy policy_;

  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> q_;
  bool closed_{false};

  std::uint64_t pushes_{0};
  std::uint64_t drops_{0};
};

} // namespace pcc
