/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_BLOCKING_QUEUE_HPP_
#define NBHTTP_BLOCKING_QUEUE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace nbhttp {

// ============================================================================
// BlockingQueue (bounded, multi-producer / multi-consumer)
// ============================================================================

template <typename T>
class BlockingQueue {
 public:
  explicit BlockingQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BlockingQueue(const BlockingQueue&) = delete;
  BlockingQueue& operator=(const BlockingQueue&) = delete;

  // Blocks while the queue is full. Returns false if the queue is closed.
  bool push(T item) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_not_full_.wait(lk, [&] { return closed_ || q_.size() < capacity_; });
    if (closed_)
      return false;
    q_.push_back(std::move(item));
    cv_not_empty_.notify_one();
    return true;
  }

  // Never blocks. On failure the item is left untouched with the caller.
  bool try_push(T&& item) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || q_.size() >= capacity_)
      return false;
    q_.push_back(std::move(item));
    cv_not_empty_.notify_one();
    return true;
  }

  // Blocks while the queue is empty. Returns nullopt once closed and drained.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
    return take_front();
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lk(mu_);
    return take_front();
  }

  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_not_empty_.wait_for(lk, timeout, [&] { return closed_ || !q_.empty(); });
    return take_front();
  }

  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

  bool empty() const { return size() == 0; }

  size_t capacity() const { return capacity_; }

 private:
  // Caller holds mu_
  std::optional<T> take_front() {
    if (q_.empty())
      return std::nullopt;
    T item = std::move(q_.front());
    q_.pop_front();
    cv_not_full_.notify_one();
    return item;
  }

  size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_not_empty_;
  std::condition_variable cv_not_full_;
  std::deque<T> q_;
  bool closed_ = false;
};

}  // namespace nbhttp

#endif  // NBHTTP_BLOCKING_QUEUE_HPP_
