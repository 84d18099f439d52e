#include "conduit/body-test-util.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "conduit/buffer-consumer.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/upstream.hpp"

namespace conduit::test {

void RecordingUpstream::start() {
  ++_nbStart;
  record("start");
}

void RecordingUpstream::onBytesConsumed(std::uint64_t bytesConsumed) {
  auto current = _consumed.load();
  while (!_consumed.compare_exchange_weak(current, AddDemand(current, bytesConsumed))) {
  }
  record("consumed:" + std::to_string(bytesConsumed));
  std::function<void(std::uint64_t)> callback;
  {
    std::lock_guard lock(_mutex);
    callback = _onConsumed;
  }
  if (callback) {
    callback(bytesConsumed);
  }
}

void RecordingUpstream::allowDiscard() {
  ++_nbDiscard;
  record("discard");
}

void RecordingUpstream::disregardBackpressure() {
  ++_nbDisregard;
  record("disregard");
}

std::vector<std::string> RecordingUpstream::calls() const {
  std::lock_guard lock(_mutex);
  return _calls;
}

void RecordingUpstream::setOnConsumed(std::function<void(std::uint64_t)> callback) {
  std::lock_guard lock(_mutex);
  _onConsumed = std::move(callback);
}

void RecordingUpstream::record(std::string call) {
  std::lock_guard lock(_mutex);
  _calls.push_back(std::move(call));
}

void RecordingConsumer::add(ByteChunk chunk) {
  std::function<void(const ByteChunk&)> callback;
  {
    std::lock_guard lock(_mutex);
    _chunks.push_back(chunk);
    callback = _onAdd;
  }
  if (callback) {
    callback(chunk);
  }
}

void RecordingConsumer::complete() {
  std::lock_guard lock(_mutex);
  ++_nbComplete;
}

void RecordingConsumer::error(std::exception_ptr error) {
  std::lock_guard lock(_mutex);
  _errors.push_back(std::move(error));
}

std::string RecordingConsumer::data() const {
  std::lock_guard lock(_mutex);
  std::string ret;
  for (const ByteChunk& chunk : _chunks) {
    ret.append(chunk.view());
  }
  return ret;
}

std::vector<std::size_t> RecordingConsumer::chunkSizes() const {
  std::lock_guard lock(_mutex);
  std::vector<std::size_t> sizes;
  for (const ByteChunk& chunk : _chunks) {
    sizes.push_back(chunk.size());
  }
  return sizes;
}

uint32_t RecordingConsumer::nbComplete() const {
  std::lock_guard lock(_mutex);
  return _nbComplete;
}

std::vector<std::exception_ptr> RecordingConsumer::errors() const {
  std::lock_guard lock(_mutex);
  return _errors;
}

uint32_t RecordingConsumer::nbTerminal() const {
  std::lock_guard lock(_mutex);
  return _nbComplete + static_cast<uint32_t>(_errors.size());
}

void RecordingConsumer::setOnAdd(std::function<void(const ByteChunk&)> callback) {
  std::lock_guard lock(_mutex);
  _onAdd = std::move(callback);
}

ByteChunk MakeChunk(std::size_t n, char c) { return ByteChunk(std::string(n, c)); }

}  // namespace conduit::test
