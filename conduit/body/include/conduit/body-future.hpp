#pragma once

#include <condition_variable>
#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace conduit {

// Single assignment result of an asynchronous body operation.
// Copies share the same state: one side resolves it with complete() or completeExceptionally(), the other side
// waits with get(), registers a callback with onComplete(), or co_awaits it from a coroutine.
// Callbacks and resumed coroutines run on the thread that resolves the future.
template <class T>
class BodyFuture {
 public:
  BodyFuture() : _state(std::make_shared<State>()) {}

  [[nodiscard]] static BodyFuture Ready(T value) {
    BodyFuture future;
    future.complete(std::move(value));
    return future;
  }

  [[nodiscard]] static BodyFuture Failed(std::exception_ptr error) {
    BodyFuture future;
    future.completeExceptionally(std::move(error));
    return future;
  }

  // Returns false if the future was already resolved, in which case value is dropped.
  bool complete(T value) {
    return resolve([&value](State& state) { state.value.emplace(std::move(value)); });
  }

  // Returns false if the future was already resolved.
  bool completeExceptionally(std::exception_ptr error) {
    return resolve([&error](State& state) { state.error = std::move(error); });
  }

  [[nodiscard]] bool ready() const {
    std::lock_guard lock(_state->mutex);
    return _state->done;
  }

  // Blocks until resolved. Returns a copy of the value or rethrows the error.
  T get() const {
    std::unique_lock lock(_state->mutex);
    _state->cv.wait(lock, [this] { return _state->done; });
    if (_state->error) {
      std::rethrow_exception(_state->error);
    }
    return *_state->value;
  }

  // Runs callback once resolved, immediately on this thread if it already is.
  void onComplete(std::function<void()> callback) const {
    std::unique_lock lock(_state->mutex);
    if (!_state->done) {
      _state->callbacks.push_back(std::move(callback));
      return;
    }
    lock.unlock();
    callback();
  }

  bool await_ready() const { return ready(); }

  bool await_suspend(std::coroutine_handle<> handle) const {
    std::lock_guard lock(_state->mutex);
    if (_state->done) {
      return false;
    }
    _state->callbacks.emplace_back([handle] { handle.resume(); });
    return true;
  }

  T await_resume() const { return get(); }

 private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<T> value;
    std::exception_ptr error;
    std::vector<std::function<void()>> callbacks;
    bool done{false};
  };

  template <class Setter>
  bool resolve(Setter setter) {
    std::vector<std::function<void()>> callbacks;
    {
      std::lock_guard lock(_state->mutex);
      if (_state->done) {
        return false;
      }
      setter(*_state);
      _state->done = true;
      callbacks.swap(_state->callbacks);
    }
    _state->cv.notify_all();
    for (auto& callback : callbacks) {
      callback();
    }
    return true;
  }

  std::shared_ptr<State> _state;
};

}  // namespace conduit
