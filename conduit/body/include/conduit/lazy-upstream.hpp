#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "conduit/upstream.hpp"

namespace conduit {

// Upstream standing in for one that is not known yet.
// Signals received before forward() are recorded and replayed on the real upstream when it is attached, in the
// order onBytesConsumed, start, allowDiscard, disregardBackpressure. Afterwards every call is passed through.
class LazyUpstream final : public Upstream {
 public:
  void start() override;

  void onBytesConsumed(std::uint64_t bytesConsumed) override;

  void allowDiscard() override;

  void disregardBackpressure() override;

  // Attaches the real upstream. Throws std::logic_error if called twice or with nullptr.
  void forward(std::shared_ptr<Upstream> actual);

  [[nodiscard]] bool forwarded() const;

 private:
  mutable std::mutex _mutex;
  std::shared_ptr<Upstream> _actual;
  std::uint64_t _consumed{0};
  bool _started{false};
  bool _discardAllowed{false};
  bool _backpressureDisregarded{false};
};

}  // namespace conduit
