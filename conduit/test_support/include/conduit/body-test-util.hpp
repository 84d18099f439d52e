#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/buffer-consumer.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/upstream.hpp"

namespace conduit::test {

// Upstream recording every signal it receives, in order.
class RecordingUpstream : public Upstream {
 public:
  void start() override;
  void onBytesConsumed(std::uint64_t bytesConsumed) override;
  void allowDiscard() override;
  void disregardBackpressure() override;

  [[nodiscard]] uint32_t nbStart() const noexcept { return _nbStart.load(); }
  [[nodiscard]] uint32_t nbDiscard() const noexcept { return _nbDiscard.load(); }
  [[nodiscard]] uint32_t nbDisregard() const noexcept { return _nbDisregard.load(); }

  // Sum of all onBytesConsumed calls, saturated at kUnboundedDemand.
  [[nodiscard]] std::uint64_t consumed() const noexcept { return _consumed.load(); }

  // One entry per call: "start", "consumed:<n>", "discard" or "disregard".
  [[nodiscard]] std::vector<std::string> calls() const;

  // Called synchronously from onBytesConsumed, to simulate a producer reacting to demand.
  void setOnConsumed(std::function<void(std::uint64_t)> callback);

 private:
  void record(std::string call);

  std::atomic<uint32_t> _nbStart{0};
  std::atomic<uint32_t> _nbDiscard{0};
  std::atomic<uint32_t> _nbDisregard{0};
  std::atomic<std::uint64_t> _consumed{0};
  mutable std::mutex _mutex;
  std::vector<std::string> _calls;
  std::function<void(std::uint64_t)> _onConsumed;
};

// BufferConsumer recording the chunks and terminal signals it receives.
class RecordingConsumer : public BufferConsumer {
 public:
  void add(ByteChunk chunk) override;
  void complete() override;
  void error(std::exception_ptr error) override;

  // Concatenation of all received chunks.
  [[nodiscard]] std::string data() const;

  [[nodiscard]] std::vector<std::size_t> chunkSizes() const;

  [[nodiscard]] uint32_t nbComplete() const;

  [[nodiscard]] std::vector<std::exception_ptr> errors() const;

  // Number of complete() and error() calls.
  [[nodiscard]] uint32_t nbTerminal() const;

  // Called synchronously from add(), to exercise reentrant calls.
  void setOnAdd(std::function<void(const ByteChunk&)> callback);

 private:
  mutable std::mutex _mutex;
  std::vector<ByteChunk> _chunks;
  std::vector<std::exception_ptr> _errors;
  uint32_t _nbComplete{0};
  std::function<void(const ByteChunk&)> _onAdd;
};

// Chunk made of n times the character c.
ByteChunk MakeChunk(std::size_t n, char c = 'x');

inline ByteChunk MakeChunk(std::string_view data) { return ByteChunk(data); }

// Whether error holds an exception of type E.
template <class E>
bool HoldsException(const std::exception_ptr& error) {
  if (!error) {
    return false;
  }
  try {
    std::rethrow_exception(error);
  } catch (const E&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace conduit::test
