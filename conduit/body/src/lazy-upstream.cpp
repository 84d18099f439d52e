#include "conduit/lazy-upstream.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "conduit/upstream.hpp"

namespace conduit {

void LazyUpstream::start() {
  std::unique_lock lock(_mutex);
  if (_actual) {
    auto actual = _actual;
    lock.unlock();
    actual->start();
    return;
  }
  _started = true;
}

void LazyUpstream::onBytesConsumed(std::uint64_t bytesConsumed) {
  std::unique_lock lock(_mutex);
  if (_actual) {
    auto actual = _actual;
    lock.unlock();
    actual->onBytesConsumed(bytesConsumed);
    return;
  }
  _consumed = AddDemand(_consumed, bytesConsumed);
}

void LazyUpstream::allowDiscard() {
  std::unique_lock lock(_mutex);
  if (_actual) {
    auto actual = _actual;
    lock.unlock();
    actual->allowDiscard();
    return;
  }
  _discardAllowed = true;
}

void LazyUpstream::disregardBackpressure() {
  std::unique_lock lock(_mutex);
  if (_actual) {
    auto actual = _actual;
    lock.unlock();
    actual->disregardBackpressure();
    return;
  }
  _backpressureDisregarded = true;
}

void LazyUpstream::forward(std::shared_ptr<Upstream> actual) {
  if (!actual) {
    throw std::logic_error("Cannot forward to a null upstream");
  }
  std::unique_lock lock(_mutex);
  if (_actual) {
    throw std::logic_error("LazyUpstream already forwarded");
  }
  _actual = actual;
  const auto consumed = std::exchange(_consumed, 0);
  const bool started = _started;
  const bool discardAllowed = _discardAllowed;
  const bool backpressureDisregarded = _backpressureDisregarded;
  lock.unlock();

  if (consumed != 0) {
    actual->onBytesConsumed(consumed);
  }
  if (started) {
    actual->start();
  }
  if (discardAllowed) {
    actual->allowDiscard();
  }
  if (backpressureDisregarded) {
    actual->disregardBackpressure();
  }
}

bool LazyUpstream::forwarded() const {
  std::lock_guard lock(_mutex);
  return _actual != nullptr;
}

}  // namespace conduit
