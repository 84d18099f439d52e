#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "conduit/upstream.hpp"

namespace conduit {

// How the demand of the two halves of a split body is combined before reaching the shared producer.
enum class SplitBackpressureMode : std::uint8_t {
  // The slower consumer paces the producer. Nothing accumulates in memory because of the faster one.
  Slowest,
  // The faster consumer paces the producer. Data accumulates for the slower one.
  Fastest,
  // Only the consumer of the original body paces the producer.
  Original,
  // Only the consumer of the new body paces the producer.
  New,
  // Demand of both consumers is summed.
  Strict
};

// The two Upstream views produced by UpstreamBalancer::Balance.
struct UpstreamPair {
  std::shared_ptr<Upstream> left;
  std::shared_ptr<Upstream> right;
};

// Shares one Upstream between two consumers.
// Each view counts the bytes its consumer reports. Their counters are combined according to the
// SplitBackpressureMode and the parent receives the increase of the combined value.
// A view that called allowDiscard() no longer takes part in the computation. The parent is only told to discard
// once both views did. start() is forwarded once.
class UpstreamBalancer {
 public:
  [[nodiscard]] static UpstreamPair Balance(std::shared_ptr<Upstream> parent, SplitBackpressureMode mode);

  UpstreamBalancer(std::shared_ptr<Upstream> parent, SplitBackpressureMode mode)
      : _parent(std::move(parent)), _mode(mode) {}

  [[nodiscard]] SplitBackpressureMode mode() const noexcept { return _mode; }

 private:
  class Side;

  struct SideState {
    std::uint64_t consumed{0};
    bool discardAllowed{false};
    bool backpressureDisregarded{false};
  };

  enum class Event : std::uint8_t { Start, Consumed, Discard, Disregard };

  void onEvent(bool left, Event event, std::uint64_t bytesConsumed);

  // Demand of one side, std::nullopt when the side no longer counts.
  static std::optional<std::uint64_t> Effective(const SideState& side) noexcept;

  [[nodiscard]] std::optional<std::uint64_t> combinedDemand() const noexcept;

  std::shared_ptr<Upstream> _parent;
  SplitBackpressureMode _mode;
  std::mutex _mutex;
  SideState _left;
  SideState _right;
  std::uint64_t _forwarded{0};
  bool _started{false};
  bool _discardForwarded{false};
  bool _disregardForwarded{false};
};

}  // namespace conduit
