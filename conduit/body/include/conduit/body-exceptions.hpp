#pragma once

#include <cstdint>
#include <optional>
#include <source_location>

#include "conduit/exception.hpp"

namespace conduit {

// The number of bytes received contradicts the declared body length. Fatal for the whole body.
class IncorrectLengthException : public exception {
 public:
  IncorrectLengthException(std::uint64_t expectedLength, std::uint64_t receivedLength)
      : exception("Received {} bytes but the declared body length is {}", receivedLength, expectedLength),
        _expectedLength(expectedLength),
        _receivedLength(receivedLength) {}

  [[nodiscard]] std::uint64_t expectedLength() const noexcept { return _expectedLength; }
  [[nodiscard]] std::uint64_t receivedLength() const noexcept { return _receivedLength; }

 private:
  std::uint64_t _expectedLength;
  std::uint64_t _receivedLength;
};

// The body is larger than BodySizeLimits::maxBodySize. Fatal for the whole body.
class ContentLengthExceededException : public exception {
 public:
  ContentLengthExceededException(std::uint64_t limit, std::uint64_t receivedLength)
      : exception("The content length [{}] exceeds the maximum allowed content length [{}]", receivedLength, limit),
        _limit(limit),
        _receivedLength(receivedLength) {}

  [[nodiscard]] std::uint64_t limit() const noexcept { return _limit; }
  [[nodiscard]] std::uint64_t receivedLength() const noexcept { return _receivedLength; }

 private:
  std::uint64_t _limit;
  std::uint64_t _receivedLength;
};

// More than BodySizeLimits::maxBufferSize bytes would have to be held in memory. Only fails consumers that
// need the retained data.
class BufferLengthExceededException : public exception {
 public:
  BufferLengthExceededException(std::uint64_t limit, std::uint64_t bufferedLength)
      : exception("The buffered length [{}] exceeds the maximum allowed buffer size [{}]", bufferedLength, limit),
        _limit(limit),
        _bufferedLength(bufferedLength) {}

  [[nodiscard]] std::uint64_t limit() const noexcept { return _limit; }
  [[nodiscard]] std::uint64_t bufferedLength() const noexcept { return _bufferedLength; }

 private:
  std::uint64_t _limit;
  std::uint64_t _bufferedLength;
};

// Two sites try to consume the same body. The first one must split() the body if both need it.
class BodyAlreadyClaimedException : public exception {
 public:
  BodyAlreadyClaimedException() noexcept
      : exception("Body has already been claimed. Enable claim site tracking to find the first claim") {}

  explicit BodyAlreadyClaimedException(const std::source_location& firstClaim)
      : exception("Body has already been claimed, first claimed at {}:{} in {}", FileName(firstClaim),
                  firstClaim.line(), firstClaim.function_name()),
        _firstClaim(firstClaim) {}

  [[nodiscard]] const std::optional<std::source_location>& firstClaim() const noexcept { return _firstClaim; }

 private:
  static const char* FileName(const std::source_location& loc) noexcept;

  std::optional<std::source_location> _firstClaim;
};

}  // namespace conduit
