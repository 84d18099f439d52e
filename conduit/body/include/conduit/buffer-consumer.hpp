#pragma once

#include <exception>

#include "conduit/byte-chunk.hpp"

namespace conduit {

// Receiving side of a body: data chunks in order, then exactly one of complete() or error().
// Implementations should not throw: an exception escaping a notification is logged and swallowed, the consumer
// stays subscribed and the other consumers of the buffer still receive the event.
class BufferConsumer {
 public:
  virtual ~BufferConsumer() = default;

  virtual void add(ByteChunk chunk) = 0;

  virtual void complete() = 0;

  virtual void error(std::exception_ptr error) = 0;
};

}  // namespace conduit
