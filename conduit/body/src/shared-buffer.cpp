#include "conduit/shared-buffer.hpp"

#include <atomic>
#include <charconv>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "conduit/body-exceptions.hpp"
#include "conduit/body-future.hpp"
#include "conduit/body-size-limits.hpp"
#include "conduit/buffer-consumer.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/lazy-upstream.hpp"
#include "conduit/log.hpp"
#include "conduit/upstream.hpp"

namespace conduit {

namespace {

// An exception escaping one consumer is logged, the event is still delivered to the other consumers.
template <class Notify>
void NotifyConsumer(const Notify& notify) noexcept {
  try {
    notify();
  } catch (const std::exception& ex) {
    log::error("Body consumer threw during notification: {}", ex.what());
  } catch (...) {
    log::error("Body consumer threw an unknown exception during notification");
  }
}

}  // namespace

SharedBuffer::SharedBuffer(BodySizeLimits limits, std::shared_ptr<Upstream> rootUpstream)
    : _limits(limits.normalized()), _rootUpstream(std::move(rootUpstream)) {
  if (!_rootUpstream) {
    throw std::logic_error("SharedBuffer requires a root upstream");
  }
}

SharedBuffer::SharedBuffer(BodySizeLimits limits)
    : _limits(limits.normalized()), _lazyRoot(std::make_shared<LazyUpstream>()), _rootUpstream(_lazyRoot) {}

SharedBuffer::~SharedBuffer() {
  const auto nbReservations = _reservations.load(std::memory_order_acquire);
  if (nbReservations != 0) {
    log::warn("SharedBuffer destroyed with {} unredeemed reservation(s), a body was neither consumed nor closed",
              nbReservations);
  }
}

void SharedBuffer::attachRootUpstream(std::shared_ptr<Upstream> upstream) {
  if (!_lazyRoot) {
    throw std::logic_error("SharedBuffer was constructed with its root upstream");
  }
  _lazyRoot->forward(std::move(upstream));
}

std::vector<std::exception_ptr> SharedBuffer::suppressedErrors() const {
  std::lock_guard lock(_suppressedMutex);
  return _suppressed;
}

void SharedBuffer::setExpectedLength(std::uint64_t length) {
  dispatch([this, length] { setExpectedLength0(length); });
}

void SharedBuffer::setExpectedLengthFrom(std::string_view text) {
  std::uint64_t length{};
  const auto [ptr, errc] = std::from_chars(text.data(), text.data() + text.size(), length);
  if (errc != std::errc() || ptr != text.data() + text.size() || text.empty()) {
    log::debug("Ignoring invalid body length '{}'", text);
    return;
  }
  setExpectedLength(length);
}

void SharedBuffer::add(ByteChunk chunk) {
  dispatch([this, chunk = std::move(chunk)]() mutable { add0(std::move(chunk)); });
}

void SharedBuffer::complete() {
  dispatch([this] { complete0(); });
}

void SharedBuffer::error(std::exception_ptr error) {
  dispatch([this, error = std::move(error)]() mutable { error0(std::move(error)); });
}

void SharedBuffer::reserve() {
  auto current = _reservations.load(std::memory_order_relaxed);
  do {
    if (current == 0) {
      throw std::logic_error("Cannot reserve a body that is already streaming to all of its consumers");
    }
  } while (!_reservations.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                                std::memory_order_relaxed));
  dispatch([this] { ++_unredeemed; });
}

void SharedBuffer::redeemReservation() {
  auto current = _reservations.load(std::memory_order_relaxed);
  do {
    if (current == 0) {
      throw std::logic_error("Cannot subscribe to a body without a reservation");
    }
  } while (!_reservations.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel,
                                                std::memory_order_relaxed));
}

void SharedBuffer::subscribe(std::shared_ptr<BufferConsumer> consumer, std::shared_ptr<Upstream> specificUpstream) {
  redeemReservation();
  dispatch([this, consumer = std::move(consumer), specificUpstream = std::move(specificUpstream)]() mutable {
    subscribe0(std::move(consumer), std::move(specificUpstream));
  });
}

void SharedBuffer::subscribeFull(BodyFuture<ByteChunk> target, std::shared_ptr<Upstream> specificUpstream) {
  redeemReservation();
  dispatch([this, target = std::move(target), specificUpstream = std::move(specificUpstream)]() mutable {
    subscribeFull0(std::move(target), std::move(specificUpstream));
  });
}

void SharedBuffer::dispatch(Task task) {
  _executor.submit([this, task = std::move(task)]() mutable {
    _deferred.push_back(std::move(task));
    if (_dispatching) {
      // Called back from a notification: runs after the current task.
      return;
    }
    struct DispatchingGuard {
      explicit DispatchingGuard(bool& dispatching) noexcept : _dispatching(dispatching) { _dispatching = true; }
      DispatchingGuard(const DispatchingGuard&) = delete;
      DispatchingGuard& operator=(const DispatchingGuard&) = delete;
      ~DispatchingGuard() { _dispatching = false; }
      bool& _dispatching;
    } guard(_dispatching);

    while (!_deferred.empty()) {
      Task next = std::move(_deferred.front());
      _deferred.pop_front();
      try {
        next();
      } catch (const std::exception& ex) {
        log::error("Body notification task threw: {}", ex.what());
      } catch (...) {
        log::error("Body notification task threw an unknown exception");
      }
    }
  });
}

void SharedBuffer::setExpectedLength0(std::uint64_t length) {
  if (!std::holds_alternative<Streaming>(_state)) {
    return;
  }
  if (length > _limits.maxBodySize) {
    failFromBuffer(std::make_exception_ptr(ContentLengthExceededException(_limits.maxBodySize, length)));
    return;
  }
  if (length < _lengthSoFar) {
    failFromBuffer(std::make_exception_ptr(IncorrectLengthException(length, _lengthSoFar)));
    return;
  }
  _expectedLength.store(length, std::memory_order_release);
}

void SharedBuffer::add0(ByteChunk chunk) {
  if (!std::holds_alternative<Streaming>(_state)) {
    log::trace("Dropping {} bytes received after the end of the body", chunk.size());
    return;
  }
  const std::uint64_t newLength = _lengthSoFar + chunk.size();
  const std::uint64_t expectedLength = _expectedLength.load(std::memory_order_relaxed);
  if (expectedLength != kUnknownLength && newLength > expectedLength) {
    failFromBuffer(std::make_exception_ptr(IncorrectLengthException(expectedLength, newLength)));
    return;
  }
  if (newLength > _limits.maxBodySize) {
    failFromBuffer(std::make_exception_ptr(ContentLengthExceededException(_limits.maxBodySize, newLength)));
    return;
  }
  _lengthSoFar = newLength;

  // Notifications calling back into the buffer are deferred, so _subscribers cannot change during this loop.
  for (const auto& subscriber : _subscribers) {
    NotifyConsumer([&] { subscriber->add(chunk.duplicate()); });
  }

  if (_unredeemed == 0 && _fullSubscribers.empty()) {
    return;
  }
  if (_bufferLimitsExceeded || newLength > _limits.maxBufferSize) {
    discardBuffer();
    if (!_bufferLimitsExceeded) {
      log::debug("Body exceeded the buffer limit of {} bytes, retained bytes are dropped", _limits.maxBufferSize);
      _bufferLimitsExceeded =
          std::make_exception_ptr(BufferLengthExceededException(_limits.maxBufferSize, newLength));
    }
    failFullSubscribers(_bufferLimitsExceeded);
    return;
  }
  _buffer.push_back(std::move(chunk));
}

void SharedBuffer::complete0() {
  if (!std::holds_alternative<Streaming>(_state)) {
    log::trace("Ignoring completion of a body that already ended");
    return;
  }
  const std::uint64_t expectedLength = _expectedLength.load(std::memory_order_relaxed);
  if (expectedLength != kUnknownLength && expectedLength != _lengthSoFar) {
    failFromBuffer(std::make_exception_ptr(IncorrectLengthException(expectedLength, _lengthSoFar)));
    return;
  }
  _state = Completed{};
  _expectedLength.store(_lengthSoFar, std::memory_order_release);
  log::debug("Body completed with {} bytes", _lengthSoFar);

  auto subscribers = std::exchange(_subscribers, {});
  for (const auto& subscriber : subscribers) {
    NotifyConsumer([&] { subscriber->complete(); });
  }

  auto fullSubscribers = std::exchange(_fullSubscribers, {});
  if (!fullSubscribers.empty()) {
    // _bufferLimitsExceeded is necessarily unset here, waiting full subscribers are failed as soon as it is set.
    ByteChunk body = takeRetained();
    for (auto& fullSubscriber : fullSubscribers) {
      NotifyConsumer([&] { fullSubscriber.target.complete(body); });
    }
  }
  releaseBufferIfUnused();
}

void SharedBuffer::error0(std::exception_ptr error) {
  fail(std::move(error));
}

void SharedBuffer::failFromBuffer(std::exception_ptr error) {
  fail(std::move(error));
  _rootUpstream->allowDiscard();
}

void SharedBuffer::fail(std::exception_ptr error) {
  if (!std::holds_alternative<Streaming>(_state)) {
    log::debug("Body already ended, keeping error as suppressed");
    std::lock_guard lock(_suppressedMutex);
    _suppressed.push_back(std::move(error));
    return;
  }
  _state = Failed{error};
  discardBuffer();

  auto subscribers = std::exchange(_subscribers, {});
  for (const auto& subscriber : subscribers) {
    NotifyConsumer([&] { subscriber->error(error); });
  }
  failFullSubscribers(error);
}

void SharedBuffer::failFullSubscribers(const std::exception_ptr& error) {
  auto fullSubscribers = std::exchange(_fullSubscribers, {});
  for (auto& fullSubscriber : fullSubscribers) {
    NotifyConsumer([&] { fullSubscriber.target.completeExceptionally(error); });
    if (fullSubscriber.upstream) {
      fullSubscriber.upstream->allowDiscard();
    }
  }
}

void SharedBuffer::subscribe0(std::shared_ptr<BufferConsumer> consumer, std::shared_ptr<Upstream> specificUpstream) {
  --_unredeemed;
  if (!consumer) {
    releaseBufferIfUnused();
    return;
  }
  if (const auto* failed = std::get_if<Failed>(&_state)) {
    releaseBufferIfUnused();
    NotifyConsumer([&] { consumer->error(failed->error); });
    return;
  }
  if (_bufferLimitsExceeded) {
    // the beginning of the body is lost for this subscriber
    releaseBufferIfUnused();
    NotifyConsumer([&] { consumer->error(_bufferLimitsExceeded); });
    if (specificUpstream) {
      specificUpstream->allowDiscard();
    }
    return;
  }
  const bool completed = std::holds_alternative<Completed>(_state);
  if (!completed) {
    _subscribers.push_back(consumer);
  }
  ByteChunk retained = takeRetained();
  if (!retained.empty()) {
    NotifyConsumer([&] { consumer->add(std::move(retained)); });
  }
  if (completed) {
    NotifyConsumer([&] { consumer->complete(); });
  }
}

void SharedBuffer::subscribeFull0(BodyFuture<ByteChunk> target, std::shared_ptr<Upstream> specificUpstream) {
  --_unredeemed;
  std::exception_ptr error;
  if (const auto* failed = std::get_if<Failed>(&_state)) {
    error = failed->error;
  } else if (_lengthSoFar > _limits.maxBufferSize) {
    error = std::make_exception_ptr(BufferLengthExceededException(_limits.maxBufferSize, _lengthSoFar));
  } else if (_bufferLimitsExceeded) {
    error = _bufferLimitsExceeded;
  }
  if (error) {
    releaseBufferIfUnused();
    NotifyConsumer([&] { target.completeExceptionally(error); });
    if (specificUpstream) {
      specificUpstream->allowDiscard();
    }
    return;
  }
  if (std::holds_alternative<Completed>(_state)) {
    ByteChunk body = takeRetained();
    NotifyConsumer([&] { target.complete(std::move(body)); });
    return;
  }
  _fullSubscribers.push_back({std::move(target), std::move(specificUpstream)});
}

ByteChunk SharedBuffer::takeRetained() {
  ByteChunk retained = ByteChunk::Compose(_buffer);
  _buffer.clear();
  if (_unredeemed != 0 || !_fullSubscribers.empty()) {
    if (!retained.empty()) {
      _buffer.push_back(retained.duplicate());
    }
  }
  return retained;
}

void SharedBuffer::releaseBufferIfUnused() {
  if (_unredeemed == 0 && _fullSubscribers.empty()) {
    discardBuffer();
  }
}

void SharedBuffer::discardBuffer() noexcept {
  std::vector<ByteChunk>().swap(_buffer);
}

}  // namespace conduit
