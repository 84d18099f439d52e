#pragma once

#include <cstdint>
#include <limits>

namespace conduit {

// Demand value meaning "no limit". Consumption counters saturate at this value.
inline constexpr std::uint64_t kUnboundedDemand = std::numeric_limits<std::uint64_t>::max();

// Flow control channel from a consumer back to the producer of a body.
// All signals are advisory: a producer may still deliver a few bytes after allowDiscard(), consumers must
// tolerate it. Implementations must accept calls from any thread.
class Upstream {
 public:
  virtual ~Upstream() = default;

  // The consumer is ready to receive data. Before this call the producer may hold back everything.
  virtual void start() {}

  // The consumer processed the given number of bytes and can receive that much more.
  // kUnboundedDemand requests everything.
  virtual void onBytesConsumed([[maybe_unused]] std::uint64_t bytesConsumed) {}

  // The consumer is not interested in the remaining data, the producer may stop reading or drop it.
  virtual void allowDiscard() {}

  // The producer may send everything without waiting for onBytesConsumed.
  virtual void disregardBackpressure() {}
};

// Saturating addition of two demand counters.
[[nodiscard]] constexpr std::uint64_t AddDemand(std::uint64_t lhs, std::uint64_t rhs) noexcept {
  return kUnboundedDemand - lhs < rhs ? kUnboundedDemand : lhs + rhs;
}

}  // namespace conduit
