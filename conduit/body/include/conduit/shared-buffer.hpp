#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "conduit/body-future.hpp"
#include "conduit/body-size-limits.hpp"
#include "conduit/buffer-consumer.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/lazy-upstream.hpp"
#include "conduit/serial-executor.hpp"
#include "conduit/upstream.hpp"

namespace conduit {

// Distributes the bytes of one physical body to any number of consumers.
//
// The producer side calls add(), complete() and error(). The consumer side takes reservations with reserve()
// and redeems each of them exactly once with subscribe() (streaming, a null consumer cancels the reservation)
// or subscribeFull() (whole body at once). The buffer starts with one reservation held by its owner.
//
// While reservations are outstanding or full subscribers wait, every chunk is retained in memory so that late
// subscribers see the body from its first byte. Retained bytes are bounded by BodySizeLimits::maxBufferSize,
// total bytes by BodySizeLimits::maxBodySize.
//
// All public methods may be called from any thread and never block: mutations are serialized on an internal
// SerialExecutor. Consumers are notified from whichever thread runs the executor, and may call back into the
// buffer from their notifications: such calls run once the current notification round is over.
class SharedBuffer {
 public:
  static constexpr std::uint64_t kUnknownLength = static_cast<std::uint64_t>(-1);

  SharedBuffer(BodySizeLimits limits, std::shared_ptr<Upstream> rootUpstream);

  // Constructs a buffer whose producer upstream is attached later with attachRootUpstream().
  explicit SharedBuffer(BodySizeLimits limits);

  SharedBuffer(const SharedBuffer&) = delete;
  SharedBuffer(SharedBuffer&&) = delete;
  SharedBuffer& operator=(const SharedBuffer&) = delete;
  SharedBuffer& operator=(SharedBuffer&&) = delete;

  ~SharedBuffer();

  // Attaches the real producer upstream to a buffer constructed without one. Signals sent in the meantime are
  // replayed. Throws std::logic_error if the buffer already has its producer upstream.
  void attachRootUpstream(std::shared_ptr<Upstream> upstream);

  // The upstream given to consumers of this buffer before any split.
  [[nodiscard]] const std::shared_ptr<Upstream>& rootUpstream() const noexcept { return _rootUpstream; }

  [[nodiscard]] const BodySizeLimits& limits() const noexcept { return _limits; }

  // Declared or final length of the body, std::nullopt while unknown.
  [[nodiscard]] std::optional<std::uint64_t> expectedLength() const noexcept {
    const auto length = _expectedLength.load(std::memory_order_acquire);
    return length == kUnknownLength ? std::nullopt : std::optional<std::uint64_t>(length);
  }

  // Errors reported after the first one.
  [[nodiscard]] std::vector<std::exception_ptr> suppressedErrors() const;

  // Number of reservations not redeemed yet.
  [[nodiscard]] std::uint32_t reservations() const noexcept { return _reservations.load(std::memory_order_acquire); }

  // -- producer side

  // Declares the length of the body. The body fails if it ends up with a different length.
  void setExpectedLength(std::uint64_t length);

  // Same as setExpectedLength, from the decimal text of a length header. Invalid values are ignored.
  void setExpectedLengthFrom(std::string_view text);

  void add(ByteChunk chunk);

  void complete();

  void error(std::exception_ptr error);

  // -- consumer side

  // Adds one reservation. Throws std::logic_error if all reservations were already redeemed.
  void reserve();

  // Redeems one reservation for a streaming consumer, which first receives the retained bytes as a single chunk.
  // specificUpstream is the upstream of the subscribing consumer (it may be a view of a split).
  // A null consumer cancels the reservation. Throws std::logic_error if no reservation is left.
  void subscribe(std::shared_ptr<BufferConsumer> consumer, std::shared_ptr<Upstream> specificUpstream);

  // Redeems one reservation for a consumer of the whole body, resolved once the body is complete.
  // Throws std::logic_error if no reservation is left.
  void subscribeFull(BodyFuture<ByteChunk> target, std::shared_ptr<Upstream> specificUpstream);

 private:
  struct Streaming {};
  struct Completed {};
  struct Failed {
    std::exception_ptr error;
  };

  struct FullSubscriber {
    BodyFuture<ByteChunk> target;
    std::shared_ptr<Upstream> upstream;
  };

  using Task = std::function<void()>;

  void dispatch(Task task);

  void redeemReservation();

  void add0(ByteChunk chunk);
  void complete0();
  void error0(std::exception_ptr error);
  void setExpectedLength0(std::uint64_t length);
  void subscribe0(std::shared_ptr<BufferConsumer> consumer, std::shared_ptr<Upstream> specificUpstream);
  void subscribeFull0(BodyFuture<ByteChunk> target, std::shared_ptr<Upstream> specificUpstream);

  // Fails the body with a condition detected by the buffer itself, and tells the producer to stop.
  void failFromBuffer(std::exception_ptr error);

  void fail(std::exception_ptr error);

  void failFullSubscribers(const std::exception_ptr& error);

  // Retained bytes as a single chunk, which replaces the retained chunks unless nobody needs them anymore.
  ByteChunk takeRetained();

  void releaseBufferIfUnused();

  void discardBuffer() noexcept;

  BodySizeLimits _limits;
  std::shared_ptr<LazyUpstream> _lazyRoot;
  std::shared_ptr<Upstream> _rootUpstream;
  std::atomic<std::uint64_t> _expectedLength{kUnknownLength};
  std::atomic<std::uint32_t> _reservations{1};

  // Fields below are only accessed from tasks of _executor.
  std::variant<Streaming, Completed, Failed> _state;
  std::uint64_t _lengthSoFar{0};
  // Reservations whose subscribe task did not run yet.
  std::uint32_t _unredeemed{1};
  std::vector<std::shared_ptr<BufferConsumer>> _subscribers;
  std::vector<FullSubscriber> _fullSubscribers;
  std::vector<ByteChunk> _buffer;
  std::exception_ptr _bufferLimitsExceeded;
  std::deque<Task> _deferred;
  bool _dispatching{false};

  mutable std::mutex _suppressedMutex;
  std::vector<std::exception_ptr> _suppressed;

  SerialExecutor _executor;
};

}  // namespace conduit
