#include "conduit/upstream-balancer.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "conduit/upstream.hpp"

namespace conduit {

class UpstreamBalancer::Side final : public Upstream {
 public:
  Side(std::shared_ptr<UpstreamBalancer> balancer, bool left) : _balancer(std::move(balancer)), _left(left) {}

  void start() override { _balancer->onEvent(_left, Event::Start, 0); }

  void onBytesConsumed(std::uint64_t bytesConsumed) override {
    _balancer->onEvent(_left, Event::Consumed, bytesConsumed);
  }

  void allowDiscard() override { _balancer->onEvent(_left, Event::Discard, 0); }

  void disregardBackpressure() override { _balancer->onEvent(_left, Event::Disregard, 0); }

 private:
  std::shared_ptr<UpstreamBalancer> _balancer;
  bool _left;
};

UpstreamPair UpstreamBalancer::Balance(std::shared_ptr<Upstream> parent, SplitBackpressureMode mode) {
  auto balancer = std::make_shared<UpstreamBalancer>(std::move(parent), mode);
  return {std::make_shared<Side>(balancer, true), std::make_shared<Side>(balancer, false)};
}

std::optional<std::uint64_t> UpstreamBalancer::Effective(const SideState& side) noexcept {
  if (side.discardAllowed) {
    return std::nullopt;
  }
  if (side.backpressureDisregarded) {
    return kUnboundedDemand;
  }
  return side.consumed;
}

std::optional<std::uint64_t> UpstreamBalancer::combinedDemand() const noexcept {
  const auto left = Effective(_left);
  const auto right = Effective(_right);
  if (!left) {
    return right;
  }
  if (!right) {
    return left;
  }
  switch (_mode) {
    case SplitBackpressureMode::Slowest:
      return std::min(*left, *right);
    case SplitBackpressureMode::Fastest:
      return std::max(*left, *right);
    case SplitBackpressureMode::Original:
      return left;
    case SplitBackpressureMode::New:
      return right;
    case SplitBackpressureMode::Strict:
      return AddDemand(*left, *right);
  }
  return std::min(*left, *right);
}

void UpstreamBalancer::onEvent(bool left, Event event, std::uint64_t bytesConsumed) {
  bool forwardStart = false;
  bool forwardDiscard = false;
  bool forwardDisregard = false;
  std::uint64_t delta = 0;
  {
    std::lock_guard lock(_mutex);
    SideState& side = left ? _left : _right;
    switch (event) {
      case Event::Start:
        forwardStart = !std::exchange(_started, true);
        break;
      case Event::Consumed:
        side.consumed = AddDemand(side.consumed, bytesConsumed);
        break;
      case Event::Discard:
        side.discardAllowed = true;
        break;
      case Event::Disregard:
        side.backpressureDisregarded = true;
        break;
    }

    if (_left.discardAllowed && _right.discardAllowed) {
      forwardDiscard = !std::exchange(_discardForwarded, true);
    } else {
      const auto combined = combinedDemand();
      if (combined && *combined > _forwarded) {
        delta = *combined == kUnboundedDemand ? kUnboundedDemand : *combined - _forwarded;
        _forwarded = *combined;
      }
      const bool someoneDisregards = (!_left.discardAllowed && _left.backpressureDisregarded) ||
                                     (!_right.discardAllowed && _right.backpressureDisregarded);
      if (combined == kUnboundedDemand && someoneDisregards) {
        forwardDisregard = !std::exchange(_disregardForwarded, true);
      }
    }
  }

  // parent is called without holding the lock, it may call back synchronously
  if (delta != 0) {
    _parent->onBytesConsumed(delta);
  }
  if (forwardDisregard) {
    _parent->disregardBackpressure();
  }
  if (forwardStart) {
    _parent->start();
  }
  if (forwardDiscard) {
    _parent->allowDiscard();
  }
}

}  // namespace conduit
