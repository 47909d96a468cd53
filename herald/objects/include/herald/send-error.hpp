#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace herald {

enum class SendErrc : std::uint8_t {
  // Send attempted once the exchange transport was released or errored. Nothing was written.
  AlreadyClosed,
  // The transport failed to write the status / request line and headers. The body was never written.
  HeaderCommitFailure,
  // Failure while streaming body bytes or objects. Headers stay marked as sent.
  BodyStreamFailure,
};

std::string_view SendErrcName(SendErrc errc) noexcept;

class SendError {
 public:
  SendError(SendErrc code, std::string message) : _message(std::move(message)), _code(code) {}

  // Failure reported for any send attempted on a disposed exchange.
  static SendError AlreadyClosed() { return {SendErrc::AlreadyClosed, "This outbound is not active anymore"}; }

  [[nodiscard]] SendErrc code() const noexcept { return _code; }

  [[nodiscard]] std::string_view message() const noexcept { return _message; }

  bool operator==(const SendError&) const noexcept = default;

 private:
  std::string _message;
  SendErrc _code;
};

// Terminal outcome of a send unit: success with no value, or the failure cause.
using SendResult = std::expected<void, SendError>;

}  // namespace herald
