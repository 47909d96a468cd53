#pragma once

#include <cstddef>
#include <cstdint>

namespace herald::websocket {

// WebSocket Frame Opcodes (RFC 6455 §5.2)
enum class Opcode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,

  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

[[nodiscard]] constexpr bool IsControlFrame(Opcode op) noexcept { return static_cast<uint8_t>(op) >= 0x8; }

// Frame header bits and sizes (RFC 6455 §5.2)
inline constexpr std::byte kFinBit{0x80};
inline constexpr std::byte kMaskBit{0x80};

inline constexpr std::byte kPayloadLen16{126};
inline constexpr std::byte kPayloadLen64{127};

inline constexpr std::size_t kMinFrameHeaderSize = 2;
inline constexpr std::size_t kMaskingKeySize = 4;
inline constexpr std::size_t kMaxControlPayloadSize = 125;

}  // namespace herald::websocket
