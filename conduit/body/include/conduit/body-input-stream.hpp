#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <utility>

#include "conduit/body-stream.hpp"
#include "conduit/byte-chunk.hpp"

namespace conduit {

// Blocking reader over a BodyStream, for code that wants to read a body into its own memory.
class BodyInputStream {
 public:
  explicit BodyInputStream(BodyStream stream) noexcept : _stream(std::move(stream)) {}

  // Copies up to dest.size() bytes into dest, blocking until at least one byte is available.
  // Never copies across two chunks.
  // Returns the number of bytes copied, 0 at the end of the body. Rethrows the error of the body.
  std::size_t read(std::span<std::byte> dest);

  // Returns the rest of the current chunk, or the next one. std::nullopt at the end of the body.
  std::optional<ByteChunk> readSome();

  // Stops reading and lets the producer drop the rest of the body.
  void close();

 private:
  BodyStream _stream;
  ByteChunk _current;
};

}  // namespace conduit
