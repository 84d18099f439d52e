#include "conduit/byte-body.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <source_location>
#include <utility>

#include "conduit/body-exceptions.hpp"
#include "conduit/body-future.hpp"
#include "conduit/body-stream.hpp"
#include "conduit/buffer-consumer.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/log.hpp"
#include "conduit/shared-buffer.hpp"
#include "conduit/upstream-balancer.hpp"
#include "conduit/upstream.hpp"

namespace conduit {

namespace {
std::atomic<bool> gClaimSiteTracking{false};
}  // namespace

ByteBody::ByteBody(std::shared_ptr<SharedBuffer> buffer)
    : _buffer(std::move(buffer)), _upstream(_buffer->rootUpstream()) {}

ByteBody::ByteBody(std::shared_ptr<SharedBuffer> buffer, std::shared_ptr<Upstream> upstream) noexcept
    : _buffer(std::move(buffer)), _upstream(std::move(upstream)) {}

ByteBody::ByteBody(ByteBody&& rhs) noexcept
    : _buffer(std::move(rhs._buffer)),
      _upstream(std::move(rhs._upstream)),
      _claimSite(std::exchange(rhs._claimSite, std::nullopt)) {}

ByteBody& ByteBody::operator=(ByteBody&& rhs) {
  if (this != &rhs) {
    close();
    _buffer = std::move(rhs._buffer);
    _upstream = std::move(rhs._upstream);
    _claimSite = std::exchange(rhs._claimSite, std::nullopt);
  }
  return *this;
}

ByteBody::~ByteBody() { close(); }

void ByteBody::SetClaimSiteTracking(bool enabled) noexcept {
  gClaimSiteTracking.store(enabled, std::memory_order_relaxed);
}

bool ByteBody::ClaimSiteTracking() noexcept { return gClaimSiteTracking.load(std::memory_order_relaxed); }

std::shared_ptr<Upstream> ByteBody::claim(const std::source_location& loc) {
  if (!_upstream) {
    throwAlreadyClaimed();
  }
  if (ClaimSiteTracking()) {
    log::trace("Body claimed at {}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
    _claimSite = loc;
  }
  return std::exchange(_upstream, nullptr);
}

void ByteBody::throwAlreadyClaimed() const {
  if (_claimSite) {
    throw BodyAlreadyClaimedException(*_claimSite);
  }
  throw BodyAlreadyClaimedException();
}

BodyStream ByteBody::toStream(std::source_location loc) {
  auto upstream = claim(loc);
  return BodyStream::Subscribe(*_buffer, std::move(upstream));
}

BodyFuture<ByteChunk> ByteBody::drainFull(std::source_location loc) {
  auto upstream = claim(loc);
  upstream->start();
  upstream->onBytesConsumed(kUnboundedDemand);
  BodyFuture<ByteChunk> future;
  _buffer->subscribeFull(future, std::move(upstream));
  return future;
}

std::shared_ptr<Upstream> ByteBody::subscribe(std::shared_ptr<BufferConsumer> consumer, std::source_location loc) {
  auto upstream = claim(loc);
  _buffer->subscribe(std::move(consumer), upstream);
  return upstream;
}

ByteBody ByteBody::move(std::source_location loc) {
  auto upstream = claim(loc);
  return {_buffer, std::move(upstream)};
}

ByteBody ByteBody::split(SplitBackpressureMode mode) {
  if (!_upstream) {
    throwAlreadyClaimed();
  }
  _buffer->reserve();
  auto pair = UpstreamBalancer::Balance(std::move(_upstream), mode);
  _upstream = std::move(pair.left);
  return {_buffer, std::move(pair.right)};
}

void ByteBody::close() {
  if (!_upstream) {
    return;
  }
  auto upstream = std::exchange(_upstream, nullptr);
  upstream->allowDiscard();
  upstream->disregardBackpressure();
  upstream->start();
  _buffer->subscribe(nullptr, std::move(upstream));
}

void ByteBody::allowDiscard() {
  if (_upstream) {
    _upstream->allowDiscard();
  }
}

}  // namespace conduit
