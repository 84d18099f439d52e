#include "conduit/byte-chunk.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>
#include <utility>

#include "conduit/raw-bytes.hpp"

namespace conduit {

ByteChunk::ByteChunk(RawBytes bytes) : _size(bytes.size()) {
  if (_size != 0) {
    _storage = std::make_shared<const RawBytes>(std::move(bytes));
  }
}

ByteChunk ByteChunk::Compose(std::span<const ByteChunk> pieces) {
  std::size_t totalSize = 0;
  const ByteChunk* lastNonEmpty = nullptr;
  std::size_t nbNonEmpty = 0;
  for (const ByteChunk& piece : pieces) {
    if (!piece.empty()) {
      totalSize += piece.size();
      lastNonEmpty = &piece;
      ++nbNonEmpty;
    }
  }
  if (nbNonEmpty == 0) {
    return {};
  }
  if (nbNonEmpty == 1) {
    return lastNonEmpty->duplicate();
  }
  RawBytes composed(totalSize);
  for (const ByteChunk& piece : pieces) {
    composed.unchecked_append(piece.bytes());
  }
  return ByteChunk(std::move(composed));
}

ByteChunk ByteChunk::splitFront(std::size_t n) noexcept {
  n = std::min(n, _size);
  ByteChunk front(_storage, _offset, n);
  _offset += n;
  _size -= n;
  if (_size == 0) {
    _storage.reset();
    _offset = 0;
  }
  if (n == 0) {
    front._storage.reset();
    front._offset = 0;
  }
  return front;
}

}  // namespace conduit
