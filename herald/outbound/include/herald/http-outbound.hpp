#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "herald/byte-buffer.hpp"
#include "herald/charset.hpp"
#include "herald/exchange-info.hpp"
#include "herald/header-commit-latch.hpp"
#include "herald/outbound-config.hpp"
#include "herald/outbound-object.hpp"
#include "herald/outbound-transport.hpp"
#include "herald/payload-stream.hpp"
#include "herald/send-gate.hpp"
#include "herald/send-unit.hpp"

namespace herald {

enum class SendKind : std::uint8_t { HeadersOnly, Body, ObjectStream, TextStream };

std::string_view SendKindName(SendKind kind) noexcept;

// Outbound side of one HTTP exchange (request/response or upgrade cycle) over a connection.
//
// Guarantees that the status / request line and headers are committed to the transport exactly once,
// before any body bytes, whatever the number of send units built and attached concurrently.
//
// Every send method returns a fresh lazy SendUnit: nothing happens (no gate access, no transport call) until
// a consumer subscribes to it, and each attachment decides on its own whether it commits the headers.
// The disposed state of the transport is checked when attaching.
//
// The exchange (and its transport) must outlive the units it produced and their subscriptions.
// Building and subscribing units is thread safe.
class HttpOutbound {
 public:
  HttpOutbound(OutboundTransport& transport, ExchangeInfo info, OutboundConfig config = {});

  // Continues 'replaced' on the same connection (after an upgrade for instance): if 'replaced' already sent
  // its headers, they are considered sent for this exchange as well.
  HttpOutbound(OutboundTransport& transport, const HttpOutbound& replaced, ExchangeInfo info);

  HttpOutbound(const HttpOutbound&) = delete;
  HttpOutbound(HttpOutbound&&) = delete;
  HttpOutbound& operator=(const HttpOutbound&) = delete;
  HttpOutbound& operator=(HttpOutbound&&) = delete;

  ~HttpOutbound() = default;

  // Commits the headers if not done yet, then streams each buffer of 'payload' as body bytes.
  // 'payload' is not opened before the header commit succeeded.
  [[nodiscard]] SendUnit send(PayloadStream<ByteBuffer> payload);

  // Same as send(), for a stream of objects framed by the transport.
  [[nodiscard]] SendUnit sendObjects(PayloadStream<OutboundObject> payload);

  // Same as send(), for UTF-8 text chunks.
  // On a websocket exchange each chunk becomes a text frame sent through the object path.
  // Otherwise each chunk is encoded with 'charset' into exactly one buffer allocated from the transport.
  [[nodiscard]] SendUnit sendText(PayloadStream<std::string> text, Charset charset);

  // sendText() with the configured charset.
  [[nodiscard]] SendUnit sendText(PayloadStream<std::string> text) {
    return sendText(std::move(text), _config.charset);
  }

  // Commits the headers if not done yet. Succeeds without any transport call when they already were.
  [[nodiscard]] SendUnit sendHeaders();

  [[nodiscard]] bool hasSentHeaders() const noexcept { return _gate.hasSentHeaders(); }

  [[nodiscard]] bool isWebsocketUpgrade() const noexcept { return _info.websocketUpgrade; }

  [[nodiscard]] bool isDisposed() const noexcept { return _transport->isDisposed(); }

  [[nodiscard]] const ExchangeInfo& info() const noexcept { return _info; }

  [[nodiscard]] const OutboundConfig& config() const noexcept { return _config; }

  // "ws:<uri>" for websocket exchanges, "<METHOD>:<uri>" otherwise.
  [[nodiscard]] std::string toString() const;

 private:
  using BodyFactory = std::function<SendUnit()>;

  SendUnit sendBytesAs(SendKind kind, PayloadStream<ByteBuffer> payload);
  SendUnit sendObjectsAs(SendKind kind, PayloadStream<OutboundObject> payload);

  // Lazy unit running the header gate then 'body'.
  SendUnit sendWithHeaders(SendKind kind, BodyFactory body);

  // Gate winner: subscribes the transport header commit, then runs 'body' if not empty and the commit succeeded.
  void commitHeaders(SendKind kind, const std::shared_ptr<SendSink>& sink, BodyFactory body);

  // Gate loser (or headers already sent): runs 'body' according to the configured HeaderOrdering.
  // An empty 'body' completes the sink instead.
  void followCommit(SendKind kind, const std::shared_ptr<SendSink>& sink, BodyFactory body);

  void streamBody(SendKind kind, const BodyFactory& body, const std::shared_ptr<SendSink>& sink);

  void trace(SendKind kind, std::string_view path) const;

  OutboundTransport* _transport;
  ExchangeInfo _info;
  OutboundConfig _config;
  SendGate _gate;
  HeaderCommitLatch _commitLatch;
};

}  // namespace herald
