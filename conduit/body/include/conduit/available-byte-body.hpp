#pragma once

#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <utility>

#include "conduit/byte-body.hpp"
#include "conduit/byte-chunk.hpp"

namespace conduit {

// Body whose bytes are all in memory already. Follows the claim discipline of ByteBody, but splitting it only
// shares the bytes.
class AvailableByteBody {
 public:
  explicit AvailableByteBody(ByteChunk data) noexcept : _data(std::move(data)) {}

  AvailableByteBody(const AvailableByteBody&) = delete;
  AvailableByteBody(AvailableByteBody&& rhs) noexcept
      : _data(std::exchange(rhs._data, std::nullopt)),
        _length(rhs._length),
        _claimSite(std::exchange(rhs._claimSite, std::nullopt)) {}
  AvailableByteBody& operator=(const AvailableByteBody&) = delete;
  AvailableByteBody& operator=(AvailableByteBody&& rhs) noexcept {
    if (this != &rhs) {
      _data = std::exchange(rhs._data, std::nullopt);
      _length = rhs._length;
      _claimSite = std::exchange(rhs._claimSite, std::nullopt);
    }
    return *this;
  }

  ~AvailableByteBody() = default;

  // Length of the body, also known once claimed.
  [[nodiscard]] std::uint64_t length() const noexcept { return _length; }

  // Claims the body and returns its bytes.
  [[nodiscard]] ByteChunk toChunk(std::source_location loc = std::source_location::current());

  // Claims the body and returns a copy of its bytes as a string.
  [[nodiscard]] std::string toString(std::source_location loc = std::source_location::current());

  // Claims the body and turns it into a streaming body that is already complete.
  [[nodiscard]] ByteBody toStreaming(std::source_location loc = std::source_location::current());

  // Returns a second handle on the same bytes. Throws BodyAlreadyClaimedException if this handle is claimed.
  [[nodiscard]] AvailableByteBody split() const;

  // Claims this handle and returns a new one on the same bytes.
  [[nodiscard]] AvailableByteBody move(std::source_location loc = std::source_location::current());

  // Releases the bytes. No-op if claimed.
  void close() noexcept;

  [[nodiscard]] bool claimed() const noexcept { return !_data.has_value(); }

 private:
  ByteChunk claim(const std::source_location& loc);

  [[noreturn]] void throwAlreadyClaimed() const;

  std::optional<ByteChunk> _data;
  std::uint64_t _length{_data ? _data->size() : 0};
  std::optional<std::source_location> _claimSite;
};

}  // namespace conduit
