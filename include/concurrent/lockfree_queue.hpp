#ifndef LOCKFREE_QUEUE_HPP_
#define LOCKFREE_QUEUE_HPP_

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

namespace recon {
namespace concurrent {

/**
 * Lock-free Multiple Producer Single Consumer (MPSC) queue.
 * Producers never block; exactly one thread may call dequeue().
 * T must be default constructible (the queue keeps a dummy node).
 */
template <typename T>
class LockFreeQueue {
 private:
  struct Node {
    T data;
    std::atomic<Node*> next;

    explicit Node(T value) : data(std::move(value)), next(nullptr) {}
  };

 public:
  LockFreeQueue() : size_(0) {
    Node* dummy = new Node(T{});
    head_ = dummy;
    tail_.store(dummy);
  }

  ~LockFreeQueue() {
    while (dequeue()) {
    }
    delete head_;
  }

  // Non-copyable
  LockFreeQueue(const LockFreeQueue&) = delete;
  LockFreeQueue& operator=(const LockFreeQueue&) = delete;

  /**
   * Enqueue an item (thread-safe for multiple producers).
   */
  void enqueue(T item) {
    Node* node = new Node(std::move(item));
    Node* previous = tail_.exchange(node, std::memory_order_acq_rel);
    previous->next.store(node, std::memory_order_release);
    size_.fetch_add(1, std::memory_order_relaxed);
  }

  /**
   * Dequeue an item (single consumer only).
   * Returns empty optional if the queue is empty or a producer is mid-link.
   */
  std::optional<T> dequeue() {
    Node* next = head_->next.load(std::memory_order_acquire);
    if (next == nullptr) {
      return std::nullopt;
    }

    T result = std::move(next->data);
    delete head_;
    head_ = next;
    size_.fetch_sub(1, std::memory_order_relaxed);
    return result;
  }

  /**
   * Check if queue is empty (consumer side).
   */
  bool empty() const {
    return head_->next.load(std::memory_order_acquire) == nullptr;
  }

  /**
   * Approximate size, for monitoring only.
   */
  size_t size() const { return size_.load(std::memory_order_relaxed); }

 private:
  Node* head_;  // consumer owned
  std::atomic<Node*> tail_;
  std::atomic<size_t> size_;
};

}  // namespace concurrent
}  // namespace recon

#endif  // LOCKFREE_QUEUE_HPP_
