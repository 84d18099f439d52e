#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <utility>

#include "conduit/raw-bytes.hpp"

namespace conduit {

// Immutable slice of reference-counted bytes: the unit of data flowing through a body.
// Copying a ByteChunk (or calling duplicate()) shares the underlying storage, it never copies the bytes.
class ByteChunk {
 public:
  ByteChunk() noexcept = default;

  // Takes ownership of the given bytes.
  explicit ByteChunk(RawBytes bytes);

  // Copies the given characters into a new chunk.
  explicit ByteChunk(std::string_view data) : ByteChunk(RawBytes(data)) {}

  // Concatenates the given pieces into a single chunk.
  // A single piece is shared as is, several pieces are copied into one new contiguous storage.
  [[nodiscard]] static ByteChunk Compose(std::span<const ByteChunk> pieces);

  [[nodiscard]] std::size_t size() const noexcept { return _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
    return _storage ? std::span<const std::byte>(_storage->data() + _offset, _size) : std::span<const std::byte>{};
  }

  [[nodiscard]] std::string_view view() const noexcept {
    const auto data = bytes();
    return {reinterpret_cast<const char*>(data.data()), data.size()};
  }

  // New reference to the same bytes.
  [[nodiscard]] ByteChunk duplicate() const noexcept { return *this; }

  // Returns the first n bytes (n is clamped to size()) and advances this chunk past them.
  [[nodiscard]] ByteChunk splitFront(std::size_t n) noexcept;

  // Number of chunks currently sharing the same storage, 0 for an empty default chunk.
  [[nodiscard]] long useCount() const noexcept { return _storage.use_count(); }

 private:
  ByteChunk(std::shared_ptr<const RawBytes> storage, std::size_t offset, std::size_t size) noexcept
      : _storage(std::move(storage)), _offset(offset), _size(size) {}

  std::shared_ptr<const RawBytes> _storage;
  std::size_t _offset{0};
  std::size_t _size{0};
};

}  // namespace conduit
