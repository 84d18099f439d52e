#include "conduit/available-byte-body.hpp"

#include <memory>
#include <source_location>
#include <string>
#include <utility>

#include "conduit/body-exceptions.hpp"
#include "conduit/body-size-limits.hpp"
#include "conduit/byte-body.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/log.hpp"
#include "conduit/shared-buffer.hpp"
#include "conduit/upstream.hpp"

namespace conduit {

ByteChunk AvailableByteBody::claim(const std::source_location& loc) {
  if (!_data) {
    throwAlreadyClaimed();
  }
  if (ByteBody::ClaimSiteTracking()) {
    log::trace("Body claimed at {}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
    _claimSite = loc;
  }
  ByteChunk data = std::move(*_data);
  _data.reset();
  return data;
}

void AvailableByteBody::throwAlreadyClaimed() const {
  if (_claimSite) {
    throw BodyAlreadyClaimedException(*_claimSite);
  }
  throw BodyAlreadyClaimedException();
}

ByteChunk AvailableByteBody::toChunk(std::source_location loc) { return claim(loc); }

std::string AvailableByteBody::toString(std::source_location loc) { return std::string(claim(loc).view()); }

ByteBody AvailableByteBody::toStreaming(std::source_location loc) {
  ByteChunk data = claim(loc);
  // all the data is there already, there is nobody to pace
  auto buffer = std::make_shared<SharedBuffer>(BodySizeLimits::Unlimited(), std::make_shared<Upstream>());
  buffer->setExpectedLength(data.size());
  buffer->add(std::move(data));
  buffer->complete();
  return ByteBody(std::move(buffer));
}

AvailableByteBody AvailableByteBody::split() const {
  if (!_data) {
    throwAlreadyClaimed();
  }
  return AvailableByteBody(_data->duplicate());
}

AvailableByteBody AvailableByteBody::move(std::source_location loc) { return AvailableByteBody(claim(loc)); }

void AvailableByteBody::close() noexcept { _data.reset(); }

}  // namespace conduit
