#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>

namespace conduit {

// Runs submitted tasks one at a time without owning a thread and without ever blocking a caller.
//
// submit() pushes the task on a lock-free multi-producer queue and then tries to take the owner token.
// The thread that gets the token runs queued tasks until the queue is empty, releases the token and checks the
// queue once more, because a racing producer may have pushed after the last pop and failed to take the token.
// A thread that does not get the token leaves its task to the current owner.
//
// Guarantees:
//  - No two tasks ever run concurrently.
//  - Tasks submitted from the same thread run in submission order.
//  - submit() from inside a running task drains the queue immediately on the same thread (nested run).
class SerialExecutor {
 public:
  using Task = std::function<void()>;

  SerialExecutor() noexcept = default;

  SerialExecutor(const SerialExecutor&) = delete;
  SerialExecutor(SerialExecutor&&) = delete;
  SerialExecutor& operator=(const SerialExecutor&) = delete;
  SerialExecutor& operator=(SerialExecutor&&) = delete;

  // Pending tasks that were never run are dropped.
  ~SerialExecutor();

  void submit(Task task);

  // Whether some thread currently holds the owner token.
  [[nodiscard]] bool running() const noexcept {
    return _owner.load(std::memory_order_acquire) != std::thread::id{};
  }

  // Whether the calling thread is running tasks of this executor.
  [[nodiscard]] bool runningInThisThread() const noexcept {
    return _owner.load(std::memory_order_acquire) == std::this_thread::get_id();
  }

  // Number of submitted tasks that have not started yet.
  [[nodiscard]] std::size_t pendingTasks() const noexcept { return _pending.load(std::memory_order_acquire); }

 private:
  struct Node {
    Node* next{nullptr};
    Task task;
  };

  void push(Node* node) noexcept;

  // Only called by the owner. Returns the oldest queued task, nullptr if there is none.
  Node* pop() noexcept;

  // Runs tasks until the queue is empty.
  void drain();

  [[nodiscard]] bool hasQueuedTasks() const noexcept {
    return _incoming.load(std::memory_order_acquire) != nullptr || _batch.load(std::memory_order_acquire) != nullptr;
  }

  bool tryAcquire() noexcept;

  void release() noexcept;

  // Producers push on a lock-free stack (newest first). The owner detaches the whole stack at once and reverses
  // it into _batch (oldest first), which only the owner modifies.
  std::atomic<Node*> _incoming{nullptr};
  std::atomic<Node*> _batch{nullptr};
  std::atomic<std::size_t> _pending{0};
  std::atomic<std::thread::id> _owner;
};

}  // namespace conduit
