#pragma once

#include <cstdint>
#include <limits>

namespace conduit {

// Size budget of one body.
struct BodySizeLimits {
  // Limits that never trigger.
  static constexpr BodySizeLimits Unlimited() noexcept {
    return {std::numeric_limits<std::uint64_t>::max(), std::numeric_limits<std::uint64_t>::max()};
  }

  // Copy of these limits with maxBufferSize capped to maxBodySize, which no buffered body can exceed anyway.
  [[nodiscard]] constexpr BodySizeLimits normalized() const noexcept {
    return {maxBodySize, maxBufferSize < maxBodySize ? maxBufferSize : maxBodySize};
  }

  // Maximum number of bytes a body may contain in total. Exceeding it fails the body for every consumer,
  // streaming ones included, and asks the producer to discard the rest.
  // Default: 8 MiB.
  std::uint64_t maxBodySize{8UL << 20};

  // Maximum number of bytes that may be held in memory waiting for a consumer. Exceeding it only fails
  // consumers that need the whole body at once; streaming consumers keep receiving data.
  // Values above maxBodySize behave as maxBodySize. Default: 8 MiB.
  std::uint64_t maxBufferSize{8UL << 20};
};

}  // namespace conduit
