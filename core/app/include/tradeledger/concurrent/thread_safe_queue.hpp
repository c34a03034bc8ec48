#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace tradeledger {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO handing items from producer threads to a
// consumer thread. In the ledger it carries committed LedgerUpdates from the
// writer that committed them to the IpcServer worker, which serializes and
// publishes them on the PUB socket.
//
// Thread model: Any number of producers and consumers. pop() blocks until an
// item arrives; try_pop() and drain() never block.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Appends one item and wakes one blocked pop().
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // Removes and returns the front item, waiting for a producer if the queue
  // is empty. The predicate re-check covers spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // Takes every queued item in one critical section, in FIFO order. Lets the
  // IPC worker publish a burst of updates from one commit without
  // interleaving with items pushed while it publishes.
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::vector<T> items;
    std::lock_guard lock(mutex_);
    items.reserve(queue_.size());
    for (T& item : queue_) {
      items.push_back(std::move(item));
    }
    queue_.clear();
    return items;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace tradeledger
