#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

namespace conduit {

// Owning, growable byte buffer backed by malloc/realloc.
// It is the storage behind ByteChunk and the target used to compose several chunks into one contiguous body.
// Prefer ByteChunk in interfaces: RawBytes is never shared, only moved.
class RawBytes {
 public:
  using value_type = std::byte;
  using size_type = std::size_t;
  using pointer = value_type *;
  using const_pointer = const value_type *;
  using iterator = value_type *;
  using const_iterator = const value_type *;

  RawBytes() noexcept = default;

  explicit RawBytes(size_type capacity);

  explicit RawBytes(std::span<const std::byte> data);

  explicit RawBytes(std::string_view data);

  RawBytes(const RawBytes &rhs);
  RawBytes(RawBytes &&rhs) noexcept;

  RawBytes &operator=(const RawBytes &rhs);
  RawBytes &operator=(RawBytes &&rhs) noexcept;

  ~RawBytes();

  // Appends without checking capacity. Caller must have reserved enough space.
  void unchecked_append(std::span<const std::byte> data);

  void append(std::span<const std::byte> data);

  void append(std::string_view data);

  void clear() noexcept { _size = 0; }

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  // Growth is exponential.
  void ensureAvailableCapacity(size_type availableCapacity);

  void reserve(size_type newCapacity);

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] std::string_view asStringView() const noexcept {
    return {reinterpret_cast<const char *>(_buf), _size};
  }

  operator std::span<const std::byte>() const noexcept { return {_buf, _size}; }

  void swap(RawBytes &rhs) noexcept;

  bool operator==(const RawBytes &rhs) const noexcept;

  using trivially_relocatable = std::true_type;

 private:
  void reallocUp(size_type newCapacity);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(RawBytes &lhs, RawBytes &rhs) noexcept { lhs.swap(rhs); }

}  // namespace conduit
