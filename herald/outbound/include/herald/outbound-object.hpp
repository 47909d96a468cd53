#pragma once

#include <string_view>
#include <variant>

#include "herald/byte-buffer.hpp"
#include "herald/websocket-frame.hpp"

namespace herald {

// Payload element of an object stream. The transport decides how each alternative is framed on the wire.
using OutboundObject = std::variant<ByteBuffer, websocket::TextFrame, websocket::BinaryFrame>;

// Short name of the held alternative, for logs.
constexpr std::string_view OutboundObjectKind(const OutboundObject& object) noexcept {
  switch (object.index()) {
    case 0:
      return "bytes";
    case 1:
      return "text-frame";
    default:
      return "binary-frame";
  }
}

}  // namespace herald
