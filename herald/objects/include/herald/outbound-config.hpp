#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "herald/charset.hpp"

namespace herald {

// How a send attempt that lost the header gate orders its body against the winner's header commit.
enum class HeaderOrdering : std::uint8_t {
  // Losers stream their body immediately. Correct only if the transport enqueues writes in invocation order
  // and the winner enqueues the header commit synchronously when it wins (ConnectionOutbound does both).
  TransportSerialized,
  // Losers wait for the winner's header commit outcome before streaming. Use with transports that do not
  // serialize writes per connection.
  AwaitCommit,
};

std::string_view HeaderOrderingName(HeaderOrdering ordering) noexcept;

/// Outbound settings of an exchange.
///
/// Designed to be shared by all exchanges of a connection (or server), it is copied into each HttpOutbound.
struct OutboundConfig {
  /// Charset used by HttpOutbound::sendText when none is given explicitly.
  /// Default: UTF-8.
  Charset charset{Charset::utf8};

  /// Ordering policy of losing send attempts.
  /// Default: TransportSerialized.
  HeaderOrdering headerOrdering{HeaderOrdering::TransportSerialized};

  /// Extra capacity reserved by each buffer allocated when converting a text chunk to bytes.
  /// Useful when a transport appends framing in place. Default: 0.
  std::size_t textBufferExtraCapacity{0};

  /// Maximum value accepted for textBufferExtraCapacity.
  static constexpr std::size_t kMaxTextBufferExtraCapacity = 1UL << 20;

  /// Emit a debug log line for each attachment to a send unit (gate outcome, path taken).
  /// Default: false.
  bool traceSends{false};

  OutboundConfig& withCharset(Charset value) {
    charset = value;
    return *this;
  }

  OutboundConfig& withHeaderOrdering(HeaderOrdering value) {
    headerOrdering = value;
    return *this;
  }

  OutboundConfig& withTextBufferExtraCapacity(std::size_t value) {
    textBufferExtraCapacity = value;
    return *this;
  }

  OutboundConfig& withTraceSends(bool value = true) {
    traceSends = value;
    return *this;
  }

  /// Validates the configuration.
  /// Throws herald::invalid_argument if any setting is out of valid range.
  void validate() const;

  bool operator==(const OutboundConfig&) const noexcept = default;
};

}  // namespace herald
