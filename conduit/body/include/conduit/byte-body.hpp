#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>

#include "conduit/body-future.hpp"
#include "conduit/body-stream.hpp"
#include "conduit/buffer-consumer.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/shared-buffer.hpp"
#include "conduit/upstream-balancer.hpp"
#include "conduit/upstream.hpp"

namespace conduit {

// Handle on a body that can be consumed exactly once.
//
// toStream(), drainFull(), subscribe() and move() claim the body: any further claim on the same handle throws
// BodyAlreadyClaimedException. A body needed twice must be split() before being claimed, each handle can then
// be claimed once.
//
// A handle that is destroyed without being claimed is closed, telling the producer that the data is not needed.
class ByteBody {
 public:
  // Handle holding the initial reservation of buffer, paced by its root upstream.
  explicit ByteBody(std::shared_ptr<SharedBuffer> buffer);

  // Handle holding one reservation of buffer, paced by upstream.
  ByteBody(std::shared_ptr<SharedBuffer> buffer, std::shared_ptr<Upstream> upstream) noexcept;

  ByteBody(const ByteBody&) = delete;
  ByteBody(ByteBody&& rhs) noexcept;
  ByteBody& operator=(const ByteBody&) = delete;
  ByteBody& operator=(ByteBody&& rhs);

  ~ByteBody();

  // When enabled, claims record their call site, which is reported by BodyAlreadyClaimedException and logged at
  // trace level. Disabled by default.
  static void SetClaimSiteTracking(bool enabled) noexcept;

  [[nodiscard]] static bool ClaimSiteTracking() noexcept;

  // Claims the body and streams its chunks.
  [[nodiscard]] BodyStream toStream(std::source_location loc = std::source_location::current());

  // Claims the body and returns a future of the whole body in a single chunk.
  // Fails with BufferLengthExceededException if the body does not fit in maxBufferSize.
  [[nodiscard]] BodyFuture<ByteChunk> drainFull(std::source_location loc = std::source_location::current());

  // Claims the body for a custom consumer. Returns the upstream through which the consumer controls the flow.
  std::shared_ptr<Upstream> subscribe(std::shared_ptr<BufferConsumer> consumer,
                                      std::source_location loc = std::source_location::current());

  // Claims this handle and returns a new handle on the same body.
  [[nodiscard]] ByteBody move(std::source_location loc = std::source_location::current());

  // Returns a second, independently claimable handle on the same body. mode tells how the consumption of both
  // handles paces the producer. Throws BodyAlreadyClaimedException if this handle is claimed.
  [[nodiscard]] ByteBody split(SplitBackpressureMode mode = SplitBackpressureMode::Slowest);

  // Releases an unclaimed body: the producer may drop its data as fast as possible. No-op if claimed.
  void close();

  // Lets the producer discard the data without claiming the body. No-op if claimed.
  void allowDiscard();

  [[nodiscard]] std::optional<std::uint64_t> expectedLength() const noexcept {
    return _buffer ? _buffer->expectedLength() : std::nullopt;
  }

  [[nodiscard]] bool claimed() const noexcept { return _upstream == nullptr; }

 private:
  std::shared_ptr<Upstream> claim(const std::source_location& loc);

  [[noreturn]] void throwAlreadyClaimed() const;

  std::shared_ptr<SharedBuffer> _buffer;
  std::shared_ptr<Upstream> _upstream;
  std::optional<std::source_location> _claimSite;
};

}  // namespace conduit
