#include "conduit/body-stream.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "conduit/body-exceptions.hpp"
#include "conduit/buffer-consumer.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/log.hpp"
#include "conduit/shared-buffer.hpp"
#include "conduit/upstream.hpp"

namespace conduit {

class BodyStream::Consumer final : public BufferConsumer {
 public:
  explicit Consumer(std::uint64_t maxBufferSize) noexcept : _maxBufferSize(maxBufferSize) {}

  void add(ByteChunk chunk) override {
    std::function<void()> callback;
    {
      std::lock_guard lock(_mutex);
      if (_cancelled || _ended) {
        return;
      }
      const std::uint64_t unconsumed = _unconsumed + chunk.size();
      if (unconsumed > _maxBufferSize) {
        log::debug("Body stream has {} unconsumed bytes, above the limit of {}", unconsumed, _maxBufferSize);
        _error = std::make_exception_ptr(BufferLengthExceededException(_maxBufferSize, unconsumed));
        _ended = true;
      } else {
        _unconsumed = unconsumed;
        _chunks.push_back(std::move(chunk));
      }
      callback = _readyCallback;
    }
    _cv.notify_all();
    if (callback) {
      callback();
    }
  }

  void complete() override { end(nullptr); }

  void error(std::exception_ptr error) override { end(std::move(error)); }

  // Returns the next chunk, or std::nullopt at the end of the body or when nothing is available and wait is
  // false. Rethrows the error once all chunks were returned.
  std::optional<ByteChunk> take(bool wait) {
    std::unique_lock lock(_mutex);
    if (wait) {
      _cv.wait(lock, [this] { return !_chunks.empty() || _ended || _cancelled; });
    }
    if (!_chunks.empty()) {
      ByteChunk chunk = std::move(_chunks.front());
      _chunks.pop_front();
      _unconsumed -= chunk.size();
      return chunk;
    }
    if (_error && !_cancelled) {
      std::rethrow_exception(_error);
    }
    return std::nullopt;
  }

  [[nodiscard]] bool finished() const {
    std::lock_guard lock(_mutex);
    return _cancelled || (_ended && _chunks.empty());
  }

  // Returns false if the stream already finished.
  bool cancel() {
    {
      std::lock_guard lock(_mutex);
      if (_cancelled || (_ended && _chunks.empty())) {
        return false;
      }
      _cancelled = true;
      _chunks.clear();
      _unconsumed = 0;
    }
    _cv.notify_all();
    return true;
  }

  void setReadyCallback(std::function<void()> callback) {
    std::lock_guard lock(_mutex);
    _readyCallback = std::move(callback);
  }

 private:
  void end(std::exception_ptr error) {
    std::function<void()> callback;
    {
      std::lock_guard lock(_mutex);
      if (_ended) {
        return;
      }
      _ended = true;
      _error = std::move(error);
      callback = _readyCallback;
    }
    _cv.notify_all();
    if (callback) {
      callback();
    }
  }

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<ByteChunk> _chunks;
  std::uint64_t _unconsumed{0};
  std::uint64_t _maxBufferSize;
  std::exception_ptr _error;
  std::function<void()> _readyCallback;
  bool _ended{false};
  bool _cancelled{false};
};

BodyStream BodyStream::Subscribe(SharedBuffer& buffer, std::shared_ptr<Upstream> upstream) {
  auto consumer = std::make_shared<Consumer>(buffer.limits().maxBufferSize);
  buffer.subscribe(consumer, upstream);
  return {std::move(consumer), std::move(upstream)};
}

BodyStream::BodyStream(std::shared_ptr<Consumer> consumer, std::shared_ptr<Upstream> upstream) noexcept
    : _consumer(std::move(consumer)), _upstream(std::move(upstream)) {}

BodyStream& BodyStream::operator=(BodyStream&& rhs) noexcept {
  if (this != &rhs) {
    cancel();
    _consumer = std::move(rhs._consumer);
    _upstream = std::move(rhs._upstream);
    _started = std::exchange(rhs._started, false);
  }
  return *this;
}

BodyStream::~BodyStream() { cancel(); }

std::optional<ByteChunk> BodyStream::next() { return pull(true); }

std::optional<ByteChunk> BodyStream::poll() { return pull(false); }

bool BodyStream::finished() const { return !_consumer || _consumer->finished(); }

void BodyStream::setReadyCallback(std::function<void()> callback) {
  if (_consumer) {
    _consumer->setReadyCallback(std::move(callback));
  }
}

void BodyStream::cancel() {
  if (!_consumer || !_consumer->cancel()) {
    return;
  }
  _started = true;
  _upstream->allowDiscard();
  _upstream->disregardBackpressure();
  _upstream->start();
}

void BodyStream::startIfNeeded() {
  if (!_started) {
    _started = true;
    _upstream->start();
  }
}

std::optional<ByteChunk> BodyStream::pull(bool wait) {
  if (!_consumer) {
    return std::nullopt;
  }
  startIfNeeded();
  auto chunk = _consumer->take(wait);
  if (chunk) {
    _upstream->onBytesConsumed(chunk->size());
  }
  return chunk;
}

}  // namespace conduit
