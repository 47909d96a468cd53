#pragma once

#include <atomic>
#include <cstddef>

#include "herald/byte-buffer.hpp"
#include "herald/outbound-object.hpp"
#include "herald/outbound-sink.hpp"
#include "herald/outbound-transport.hpp"
#include "herald/payload-stream.hpp"
#include "herald/response-head.hpp"
#include "herald/send-unit.hpp"
#include "herald/write-queue.hpp"

namespace herald {

// HTTP/1.1 server side OutboundTransport writing to an OutboundSink.
//
// Writes are serialized per connection in a WriteQueue and reach the sink when the connection owner calls flush().
// Units complete (from within flush()) once their bytes were written.
//
// Framing:
//   - commitHeaders() renders the status line and headers of head(). If the response has no Content-Length nor
//     Transfer-Encoding, the status allows a body, and the connection is not a websocket upgrade,
//     'Transfer-Encoding: chunked' is added and body buffers are chunk-framed.
//   - streamObjects() writes byte buffers like streamBytes(), and websocket frames as unmasked server frames
//     (only on upgraded connections, other connections fail the stream with BodyStreamFailure).
//   - end() emits the last chunk in chunked mode.
class ConnectionOutbound final : public OutboundTransport {
 public:
  explicit ConnectionOutbound(OutboundSink& sink, ResponseHead head = ResponseHead{}, bool websocketUpgrade = false);

  ConnectionOutbound(const ConnectionOutbound&) = delete;
  ConnectionOutbound& operator=(const ConnectionOutbound&) = delete;

  ~ConnectionOutbound() override;

  // Head to be committed. Modifications made once commitHeaders() was subscribed are not sent.
  ResponseHead& head() noexcept { return _head; }

  [[nodiscard]] const ResponseHead& head() const noexcept { return _head; }

  SendUnit commitHeaders() override;

  SendUnit streamBytes(PayloadStream<ByteBuffer> payload) override;

  SendUnit streamObjects(PayloadStream<OutboundObject> payload) override;

  [[nodiscard]] bool isDisposed() const noexcept override {
    return _disposed.load(std::memory_order_acquire) || _queue.broken();
  }

  // Terminates the response body (last chunk in chunked mode, nothing otherwise).
  // Subscribe to it once the last body unit completed.
  SendUnit end();

  // Writes all queued data to the sink. Returns the number of bytes written.
  std::size_t flush();

  // Releases the connection: pending and future writes fail with AlreadyClosed.
  void dispose();

  [[nodiscard]] bool chunked() const noexcept { return _chunked.load(std::memory_order_acquire); }

  [[nodiscard]] bool headersCommitted() const noexcept { return _headCommitted.load(std::memory_order_acquire); }

  [[nodiscard]] bool isWebsocketUpgrade() const noexcept { return _websocketUpgrade; }

  [[nodiscard]] std::size_t pendingWrites() const { return _queue.pendingEntries(); }

 private:
  // Applies the body framing to one buffer.
  ByteBuffer frameBody(ByteBuffer data) const;

  ByteBuffer frameObject(OutboundObject object) const;

  OutboundSink* _sink;
  ResponseHead _head;
  WriteQueue _queue;
  std::atomic<bool> _headCommitted{false};
  std::atomic<bool> _chunked{false};
  std::atomic<bool> _ended{false};
  std::atomic<bool> _disposed{false};
  bool _websocketUpgrade;
};

}  // namespace herald
