#pragma once

#include <cstddef>
#include <span>

namespace herald {

// Byte destination of a connection (socket, TLS session, in-memory buffer...).
class OutboundSink {
 public:
  virtual ~OutboundSink() = default;

  // Writes all of 'data'. Returns false on a fatal error, the connection is then considered broken.
  virtual bool write(std::span<const std::byte> data) = 0;
};

}  // namespace herald
