#pragma once

#include <cstddef>

#include "herald/byte-buffer.hpp"
#include "herald/outbound-object.hpp"
#include "herald/payload-stream.hpp"
#include "herald/send-unit.hpp"

namespace herald {

// Write side of one connection, as seen by an exchange.
//
// Implementations must serialize the writes of a connection in the order their units are subscribed:
// HttpOutbound relies on it to order the header commit of the gate winner before the body of a loser
// (unless HeaderOrdering::AwaitCommit is configured).
class OutboundTransport {
 public:
  virtual ~OutboundTransport() = default;

  // Writes the status / request line and the headers. HttpOutbound subscribes to it at most once per exchange.
  virtual SendUnit commitHeaders() = 0;

  // Writes each buffer of 'payload' as body bytes.
  virtual SendUnit streamBytes(PayloadStream<ByteBuffer> payload) = 0;

  // Writes each object of 'payload', framed according to its type.
  virtual SendUnit streamObjects(PayloadStream<OutboundObject> payload) = 0;

  // True once the connection resource was released or errored.
  [[nodiscard]] virtual bool isDisposed() const noexcept = 0;

  // Returns an empty buffer with at least 'capacity' bytes of storage.
  virtual ByteBuffer allocateBuffer(std::size_t capacity) { return ByteBuffer(capacity); }
};

}  // namespace herald
