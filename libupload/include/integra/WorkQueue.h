#ifndef INTEGRA_LIBUPLOAD_INTEGRA_WORKQUEUE_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_WORKQUEUE_H_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace integra {

/// WorkQueue is a multi-producer multi-consumer FIFO.
///
/// A capacity of zero means unbounded; otherwise Push blocks while the queue
/// holds capacity items. After Close, Push fails and Pop keeps returning the
/// remaining items before it returns nullopt. After Cancel, both fail
/// immediately and queued items are dropped.
template <typename T>
class WorkQueue {
public:
  explicit WorkQueue(size_t capacity = 0) : capacity_(capacity) {}

  WorkQueue(const WorkQueue& no_copy) = delete;
  WorkQueue(WorkQueue&& no_move) = delete;
  WorkQueue& operator=(const WorkQueue& no_copy) = delete;
  WorkQueue& operator=(WorkQueue&& no_move) = delete;

  /// Push returns false if the item was not queued because the queue is
  /// closed or cancelled
  bool Push(T item) {
    std::unique_lock<std::mutex> lk(mutex_);
    not_full_.wait(lk, [&] {
      return closed_ || cancelled_ || capacity_ == 0 ||
             items_.size() < capacity_;
    });
    if (closed_ || cancelled_) {
      return false;
    }
    items_.emplace_back(std::move(item));
    lk.unlock();  // Notify without lock
    not_empty_.notify_one();
    return true;
  }

  /// Pop blocks until an item is available. It returns nullopt once the
  /// queue is closed and drained or cancelled.
  std::optional<T> Pop() {
    std::unique_lock<std::mutex> lk(mutex_);
    not_empty_.wait(
        lk, [&] { return cancelled_ || closed_ || !items_.empty(); });
    if (cancelled_ || items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return item;
  }

  void Close() {
    std::unique_lock<std::mutex> lk(mutex_);
    closed_ = true;
    lk.unlock();
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  void Cancel() {
    std::unique_lock<std::mutex> lk(mutex_);
    cancelled_ = true;
    items_.clear();
    lk.unlock();
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  size_t capacity_;
  bool closed_{false};
  bool cancelled_{false};
};

/// FirstErrorSlot holds at most one value: the first one offered. Later
/// offers are discarded. Offer never blocks.
template <typename T>
class FirstErrorSlot {
public:
  FirstErrorSlot() = default;
  FirstErrorSlot(const FirstErrorSlot& no_copy) = delete;
  FirstErrorSlot& operator=(const FirstErrorSlot& no_copy) = delete;

  /// Offer returns true if value was stored
  bool Offer(T value) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (value_) {
      return false;
    }
    value_ = std::move(value);
    return true;
  }

  bool HasValue() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return value_.has_value();
  }

  std::optional<T> value() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return value_;
  }

private:
  mutable std::mutex mutex_;
  std::optional<T> value_;
};

}  // namespace integra

#endif
