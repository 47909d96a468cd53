#include "herald/websocket-frame.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

#include "herald/byte-buffer.hpp"
#include "herald/invalid-argument.hpp"
#include "herald/websocket-constants.hpp"

namespace herald::websocket {

std::size_t FrameHeaderSize(std::size_t payloadSize, bool masked) noexcept {
  std::size_t headerSize = kMinFrameHeaderSize;
  if (payloadSize > 0xFFFF) {
    headerSize += 8;
  } else if (payloadSize >= static_cast<std::size_t>(kPayloadLen16)) {
    headerSize += 2;
  }
  if (masked) {
    headerSize += kMaskingKeySize;
  }
  return headerSize;
}

void BuildFrame(ByteBuffer& output, Opcode opcode, std::span<const std::byte> payload, bool fin, bool shouldMask,
                MaskingKey maskingKey) {
  const std::size_t payloadSize = payload.size();
  if (IsControlFrame(opcode) && (!fin || payloadSize > kMaxControlPayloadSize)) {
    throw invalid_argument("control frames must be final with a payload of at most 125 bytes");
  }

  output.ensureAvailableCapacity(FrameHeaderSize(payloadSize, shouldMask) + payloadSize);

  // First byte: FIN | RSV1-3 | Opcode
  std::byte byte0 = static_cast<std::byte>(opcode);
  if (fin) {
    byte0 |= kFinBit;
  }
  output.push_back(byte0);

  // Second byte: MASK | Payload length (7 bits or indicator)
  std::byte byte1{};
  if (shouldMask) {
    byte1 |= kMaskBit;
  }

  if (payloadSize < static_cast<std::size_t>(kPayloadLen16)) {
    byte1 |= static_cast<std::byte>(payloadSize);
    output.push_back(byte1);
  } else if (payloadSize <= 0xFFFF) {
    byte1 |= kPayloadLen16;
    output.push_back(byte1);
    // 16-bit big-endian length
    output.push_back(static_cast<std::byte>((payloadSize >> 8) & 0xFF));
    output.push_back(static_cast<std::byte>(payloadSize & 0xFF));
  } else {
    byte1 |= kPayloadLen64;
    output.push_back(byte1);
    // 64-bit big-endian length
    const auto len64 = static_cast<std::uint64_t>(payloadSize);
    for (int idx = 7; idx >= 0; --idx) {
      output.push_back(static_cast<std::byte>((len64 >> (idx * 8)) & 0xFF));
    }
  }

  if (shouldMask) {
    output.append(maskingKey.data(), kMaskingKeySize);
    for (std::size_t pos = 0; pos < payloadSize; ++pos) {
      output.push_back(payload[pos] ^ maskingKey[pos % kMaskingKeySize]);
    }
  } else {
    output.append(payload);
  }
}

void AppendFrame(ByteBuffer& output, const TextFrame& frame) {
  const auto text = frame.text();
  BuildFrame(output, Opcode::Text,
             std::span<const std::byte>(reinterpret_cast<const std::byte*>(text.data()), text.size()));
}

void AppendFrame(ByteBuffer& output, const BinaryFrame& frame) { BuildFrame(output, Opcode::Binary, frame.payload()); }

}  // namespace herald::websocket
