#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "herald/byte-buffer.hpp"
#include "herald/outbound-object.hpp"
#include "herald/outbound-transport.hpp"
#include "herald/payload-stream.hpp"
#include "herald/send-error.hpp"
#include "herald/send-unit.hpp"

namespace herald::test {

// In-memory OutboundTransport recording every write, in the order writes are issued, into a shared log:
//   "commit"                      for a header commit
//   "bytes:<content>"             for each body buffer
//   "object:<kind>:<content>"     for each object (kind as given by OutboundObjectKind)
//
// Writes are recorded when a unit is subscribed. Completion is either immediate, or deferred until
// completePending() / completeNext() is called (to emulate an asynchronous transport).
// All methods are thread safe.
class RecordingTransport : public OutboundTransport {
 public:
  enum class Completion : std::uint8_t { Immediate, Deferred };

  explicit RecordingTransport(Completion completion = Completion::Immediate) noexcept : _completion(completion) {}

  SendUnit commitHeaders() override;

  SendUnit streamBytes(PayloadStream<ByteBuffer> payload) override;

  SendUnit streamObjects(PayloadStream<OutboundObject> payload) override;

  [[nodiscard]] bool isDisposed() const noexcept override { return _disposed.load(std::memory_order_acquire); }

  ByteBuffer allocateBuffer(std::size_t capacity) override;

  void setDisposed(bool disposed = true) noexcept { _disposed.store(disposed, std::memory_order_release); }

  // Next header commits fail with HeaderCommitFailure and 'message', nothing is recorded for them.
  void failCommits(std::string message);

  // Next body streams fail with BodyStreamFailure and 'message' after having recorded 'okChunks' elements.
  void failBodies(std::string message, std::size_t okChunks = 0);

  // Next commitHeaders() calls throw (instead of returning a unit).
  void throwOnCommit(bool value = true) noexcept { _throwOnCommit.store(value, std::memory_order_release); }

  // Completes the deferred writes in the order they were issued, including those issued by completion callbacks.
  // Returns the number of completed writes.
  std::size_t completePending();

  // Completes the oldest deferred write. Returns false if there was none.
  bool completeNext();

  // Fails the oldest deferred write with 'error'. Returns false if there was none.
  bool failNext(SendError error);

  [[nodiscard]] std::size_t pendingCount() const;

  [[nodiscard]] std::vector<std::string> log() const;

  // Number of log entries equal to 'entry'.
  [[nodiscard]] std::size_t count(std::string_view entry) const;

  // Number of header commits written (successful subscriptions of commitHeaders() units).
  [[nodiscard]] std::size_t commitCount() const { return count("commit"); }

  // Number of commitHeaders() calls, subscribed or not.
  [[nodiscard]] std::size_t commitHeadersCalls() const noexcept { return _commitHeadersCalls.load(); }

  [[nodiscard]] std::size_t streamBytesCalls() const noexcept { return _streamBytesCalls.load(); }

  [[nodiscard]] std::size_t streamObjectsCalls() const noexcept { return _streamObjectsCalls.load(); }

  [[nodiscard]] std::size_t allocatedBuffers() const noexcept { return _allocatedBuffers.load(); }

  // Capacity requested by the last allocateBuffer() call.
  [[nodiscard]] std::size_t lastAllocatedCapacity() const noexcept { return _lastAllocatedCapacity.load(); }

 private:
  void record(std::string entry);

  // Finishes 'sink' according to the completion mode.
  void settle(const std::shared_ptr<SendSink>& sink);

  std::shared_ptr<SendSink> popPending();

  mutable std::mutex _mutex;
  std::vector<std::string> _log;
  std::vector<std::shared_ptr<SendSink>> _pending;
  std::optional<std::string> _commitFailure;
  std::optional<std::string> _bodyFailure;
  std::size_t _bodyFailureOkChunks{0};
  std::atomic<std::size_t> _commitHeadersCalls{0};
  std::atomic<std::size_t> _streamBytesCalls{0};
  std::atomic<std::size_t> _streamObjectsCalls{0};
  std::atomic<std::size_t> _allocatedBuffers{0};
  std::atomic<std::size_t> _lastAllocatedCapacity{0};
  std::atomic<bool> _disposed{false};
  std::atomic<bool> _throwOnCommit{false};
  Completion _completion;
};

}  // namespace herald::test
