#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "conduit/byte-chunk.hpp"
#include "conduit/upstream.hpp"

namespace conduit {

class SharedBuffer;

// Single pass, pull based sequence of the chunks of a body.
// Nothing is requested from the producer before the first pull. Each chunk handed out is reported to the
// upstream as consumed, which lets the producer send more.
// Errors of the body are rethrown by next() and poll() once all chunks received before the error were returned.
class BodyStream {
 public:
  // Subscribes a new stream to buffer. upstream is the flow control channel of the claimed body.
  // Chunks that are not pulled are bounded by the maxBufferSize limit of the buffer: past it the stream fails
  // with BufferLengthExceededException.
  [[nodiscard]] static BodyStream Subscribe(SharedBuffer& buffer, std::shared_ptr<Upstream> upstream);

  // An empty, finished stream.
  BodyStream() noexcept = default;

  BodyStream(const BodyStream&) = delete;
  BodyStream(BodyStream&&) noexcept = default;
  BodyStream& operator=(const BodyStream&) = delete;
  BodyStream& operator=(BodyStream&& rhs) noexcept;

  // Cancels the stream if it is not finished.
  ~BodyStream();

  // Blocks until the next chunk is available. Returns std::nullopt at the end of the body.
  std::optional<ByteChunk> next();

  // Returns the next chunk if one is available, std::nullopt otherwise. Never blocks.
  std::optional<ByteChunk> poll();

  // Whether all chunks were returned and the body ended (or the stream was cancelled).
  [[nodiscard]] bool finished() const;

  // callback runs on the producer thread each time a chunk or the end of the body arrives.
  void setReadyCallback(std::function<void()> callback);

  // Stops the stream and lets the producer drop the rest of the body as fast as possible.
  void cancel();

 private:
  class Consumer;

  BodyStream(std::shared_ptr<Consumer> consumer, std::shared_ptr<Upstream> upstream) noexcept;

  void startIfNeeded();

  std::optional<ByteChunk> pull(bool wait);

  std::shared_ptr<Consumer> _consumer;
  std::shared_ptr<Upstream> _upstream;
  bool _started{false};
};

}  // namespace conduit
