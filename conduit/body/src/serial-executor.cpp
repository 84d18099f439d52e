#include "conduit/serial-executor.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <thread>
#include <utility>

#include "conduit/log.hpp"

namespace conduit {

SerialExecutor::~SerialExecutor() {
  const auto nbDropped = _pending.load(std::memory_order_acquire);
  if (nbDropped != 0) {
    log::warn("SerialExecutor destroyed with {} pending task(s)", nbDropped);
  }
  while (Node* node = pop()) {
    std::unique_ptr<Node> owned(node);
  }
}

void SerialExecutor::submit(Task task) {
  auto node = std::make_unique<Node>();
  node->task = std::move(task);

  _pending.fetch_add(1, std::memory_order_relaxed);
  push(node.release());

  if (runningInThisThread()) {
    // Reentrant call from a running task: run it now, nested in the current drain.
    drain();
    return;
  }

  // The owner drains until empty before releasing, so after a release a non empty queue means that some
  // producer pushed late and may have missed the token: pick its work up.
  while (hasQueuedTasks() && tryAcquire()) {
    struct ReleaseGuard {
      explicit ReleaseGuard(SerialExecutor* executor) noexcept : self(executor) {}
      ReleaseGuard(const ReleaseGuard&) = delete;
      ReleaseGuard& operator=(const ReleaseGuard&) = delete;
      ~ReleaseGuard() { self->release(); }
      SerialExecutor* self;
    } guard(this);
    drain();
  }
}

void SerialExecutor::push(Node* node) noexcept {
  node->next = _incoming.load(std::memory_order_relaxed);
  while (!_incoming.compare_exchange_weak(node->next, node, std::memory_order_release, std::memory_order_relaxed)) {
  }
}

SerialExecutor::Node* SerialExecutor::pop() noexcept {
  Node* batch = _batch.load(std::memory_order_relaxed);
  if (batch == nullptr) {
    Node* stack = _incoming.exchange(nullptr, std::memory_order_acquire);
    // reverse to restore submission order
    while (stack != nullptr) {
      Node* next = stack->next;
      stack->next = batch;
      batch = stack;
      stack = next;
    }
  }
  if (batch != nullptr) {
    _batch.store(batch->next, std::memory_order_release);
  }
  return batch;
}

void SerialExecutor::drain() {
  while (Node* raw = pop()) {
    std::unique_ptr<Node> node(raw);
    _pending.fetch_sub(1, std::memory_order_relaxed);
    try {
      node->task();
    } catch (const std::exception& ex) {
      log::warn("Task submitted to SerialExecutor threw: {}", ex.what());
    } catch (...) {
      log::warn("Task submitted to SerialExecutor threw an unknown exception");
    }
  }
}

bool SerialExecutor::tryAcquire() noexcept {
  std::thread::id expected{};
  return _owner.compare_exchange_strong(expected, std::this_thread::get_id(), std::memory_order_acquire,
                                        std::memory_order_relaxed);
}

void SerialExecutor::release() noexcept { _owner.store(std::thread::id{}, std::memory_order_release); }

}  // namespace conduit
