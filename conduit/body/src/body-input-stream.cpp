#include "conduit/body-input-stream.hpp"

#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <utility>

#include "conduit/byte-chunk.hpp"

namespace conduit {

std::size_t BodyInputStream::read(std::span<std::byte> dest) {
  if (dest.empty()) {
    return 0;
  }
  while (_current.empty()) {
    auto chunk = _stream.next();
    if (!chunk) {
      return 0;
    }
    _current = std::move(*chunk);
  }
  // Only the current chunk is copied, so that a short read never waits for the producer.
  const ByteChunk piece = _current.splitFront(dest.size());
  std::memcpy(dest.data(), piece.bytes().data(), piece.size());
  return piece.size();
}

std::optional<ByteChunk> BodyInputStream::readSome() {
  if (!_current.empty()) {
    return std::exchange(_current, ByteChunk{});
  }
  return _stream.next();
}

void BodyInputStream::close() {
  _current = ByteChunk{};
  _stream.cancel();
}

}  // namespace conduit
