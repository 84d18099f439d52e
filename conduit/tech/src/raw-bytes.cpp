#include "conduit/raw-bytes.hpp"

#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <span>
#include <string_view>
#include <utility>

namespace conduit {

RawBytes::RawBytes(size_type capacity) : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawBytes::RawBytes(std::span<const std::byte> data) : RawBytes(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawBytes::RawBytes(std::string_view data) : RawBytes(std::as_bytes(std::span<const char>(data.data(), data.size()))) {}

RawBytes::RawBytes(const RawBytes &rhs) : RawBytes(rhs.size()) {
  if (!rhs.empty()) {
    std::memcpy(_buf, rhs.data(), rhs.size());
    _size = rhs.size();
  }
}

RawBytes::RawBytes(RawBytes &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawBytes &RawBytes::operator=(const RawBytes &rhs) {
  if (this != &rhs) {
    reserve(rhs.size());
    _size = rhs.size();
    if (!empty()) {
      std::memcpy(_buf, rhs.data(), _size);
    }
  }
  return *this;
}

RawBytes &RawBytes::operator=(RawBytes &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawBytes::~RawBytes() { std::free(_buf); }

void RawBytes::unchecked_append(std::span<const std::byte> data) {
  if (!data.empty()) {
    std::memcpy(_buf + _size, data.data(), data.size());
    _size += data.size();
  }
}

void RawBytes::append(std::span<const std::byte> data) {
  ensureAvailableCapacity(data.size());
  unchecked_append(data);
}

void RawBytes::append(std::string_view data) { append(std::as_bytes(std::span<const char>(data.data(), data.size()))); }

void RawBytes::ensureAvailableCapacity(size_type availableCapacity) {
  if (std::numeric_limits<size_type>::max() - _size < availableCapacity) {
    throw std::bad_alloc();
  }
  const size_type required = _size + availableCapacity;
  if (_capacity < required) {
    // prevent overflow when doubling capacity
    size_type newCapacity = _capacity > std::numeric_limits<size_type>::max() / 2U ? required : (_capacity * 2U) + 1U;
    if (newCapacity < required) {
      newCapacity = required;
    }
    reallocUp(newCapacity);
  }
}

void RawBytes::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void RawBytes::swap(RawBytes &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

bool RawBytes::operator==(const RawBytes &rhs) const noexcept {
  if (size() != rhs.size()) {
    return false;
  }
  // memcmp with nullptr is undefined behavior even if size is zero
  return empty() || std::memcmp(data(), rhs.data(), size()) == 0;
}

void RawBytes::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace conduit
