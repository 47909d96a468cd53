#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "herald/byte-buffer.hpp"
#include "herald/websocket-constants.hpp"

namespace herald::websocket {

/// 4-byte masking key type.
using MaskingKey = std::array<std::byte, kMaskingKeySize>;

/// A complete text message, sent as a single final Text frame.
/// The payload must be UTF-8 (RFC 6455 §5.6), it is not validated here.
class TextFrame {
 public:
  TextFrame() noexcept = default;

  explicit TextFrame(std::string text) noexcept : _text(std::move(text)) {}

  [[nodiscard]] std::string_view text() const noexcept { return _text; }

  bool operator==(const TextFrame&) const noexcept = default;

 private:
  std::string _text;
};

/// A complete binary message, sent as a single final Binary frame.
class BinaryFrame {
 public:
  BinaryFrame() noexcept = default;

  explicit BinaryFrame(ByteBuffer payload) noexcept : _payload(std::move(payload)) {}

  [[nodiscard]] std::span<const std::byte> payload() const noexcept { return _payload.bytes(); }

  bool operator==(const BinaryFrame&) const noexcept = default;

 private:
  ByteBuffer _payload;
};

/// Total size of a frame header for the given payload size.
[[nodiscard]] std::size_t FrameHeaderSize(std::size_t payloadSize, bool masked) noexcept;

/// Build a WebSocket frame and append it to an output buffer.
///
/// @param output      Output buffer to append the frame to
/// @param opcode      Frame opcode (Text, Binary, Close, Ping, Pong)
/// @param payload     Payload data (empty allowed)
/// @param fin         FIN bit (true for complete messages, false for fragments)
/// @param shouldMask  Whether to mask the payload (servers must not mask)
/// @param maskingKey  Masking key, only used if shouldMask is true
///
/// Control frames must have a payload of at most 125 bytes and FIN set, herald::invalid_argument is thrown otherwise.
void BuildFrame(ByteBuffer& output, Opcode opcode, std::span<const std::byte> payload, bool fin = true,
                bool shouldMask = false, MaskingKey maskingKey = {});

/// Serialize messages as final, unmasked server frames.
void AppendFrame(ByteBuffer& output, const TextFrame& frame);
void AppendFrame(ByteBuffer& output, const BinaryFrame& frame);

}  // namespace herald::websocket
