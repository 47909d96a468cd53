#include "herald/http-outbound.hpp"

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "herald/byte-buffer.hpp"
#include "herald/charset.hpp"
#include "herald/exchange-info.hpp"
#include "herald/http-method.hpp"
#include "herald/log.hpp"
#include "herald/outbound-config.hpp"
#include "herald/outbound-object.hpp"
#include "herald/outbound-transport.hpp"
#include "herald/payload-stream.hpp"
#include "herald/send-error.hpp"
#include "herald/send-unit.hpp"
#include "herald/websocket-frame.hpp"

namespace herald {

std::string_view SendKindName(SendKind kind) noexcept {
  switch (kind) {
    case SendKind::HeadersOnly:
      return "headers-only";
    case SendKind::Body:
      return "body";
    case SendKind::ObjectStream:
      return "object-stream";
    case SendKind::TextStream:
      return "text-stream";
  }
  return "unknown";
}

HttpOutbound::HttpOutbound(OutboundTransport& transport, ExchangeInfo info, OutboundConfig config)
    : _transport(&transport), _info(std::move(info)), _config(std::move(config)) {
  _config.validate();
}

HttpOutbound::HttpOutbound(OutboundTransport& transport, const HttpOutbound& replaced, ExchangeInfo info)
    : _transport(&transport), _info(std::move(info)), _config(replaced._config), _gate(replaced.hasSentHeaders()) {
  if (_gate.hasSentHeaders()) {
    _commitLatch.settle(SendResult{});
  }
}

SendUnit HttpOutbound::send(PayloadStream<ByteBuffer> payload) {
  return sendBytesAs(SendKind::Body, std::move(payload));
}

SendUnit HttpOutbound::sendObjects(PayloadStream<OutboundObject> payload) {
  return sendObjectsAs(SendKind::ObjectStream, std::move(payload));
}

SendUnit HttpOutbound::sendText(PayloadStream<std::string> text, Charset charset) {
  if (isWebsocketUpgrade()) {
    return sendObjectsAs(SendKind::TextStream, text.map([](std::string chunk) {
      return OutboundObject(std::in_place_type<websocket::TextFrame>, std::move(chunk));
    }));
  }
  return sendBytesAs(SendKind::TextStream, text.map([this, charset](const std::string& chunk) {
    ByteBuffer buffer = _transport->allocateBuffer(MaxEncodedSize(chunk, charset) + _config.textBufferExtraCapacity);
    EncodeText(chunk, charset, buffer);
    return buffer;
  }));
}

SendUnit HttpOutbound::sendHeaders() { return sendWithHeaders(SendKind::HeadersOnly, BodyFactory{}); }

std::string HttpOutbound::toString() const {
  std::string ret(isWebsocketUpgrade() ? std::string_view("ws") : http::MethodToStr(_info.method));
  ret.push_back(':');
  ret.append(_info.uri);
  return ret;
}

SendUnit HttpOutbound::sendBytesAs(SendKind kind, PayloadStream<ByteBuffer> payload) {
  return sendWithHeaders(kind, [this, payload = std::move(payload)]() { return _transport->streamBytes(payload); });
}

SendUnit HttpOutbound::sendObjectsAs(SendKind kind, PayloadStream<OutboundObject> payload) {
  return sendWithHeaders(kind, [this, payload = std::move(payload)]() { return _transport->streamObjects(payload); });
}

SendUnit HttpOutbound::sendWithHeaders(SendKind kind, BodyFactory body) {
  return SendUnit([this, kind, body = std::move(body)](const std::shared_ptr<SendSink>& sink) {
    if (isDisposed()) {
      trace(kind, "disposed");
      sink->fail(SendError::AlreadyClosed());
      return;
    }
    if (body && hasSentHeaders()) {
      trace(kind, "headers already sent");
      followCommit(kind, sink, body);
      return;
    }
    if (_gate.tryWin()) {
      trace(kind, "gate won");
      commitHeaders(kind, sink, body);
    } else {
      trace(kind, "gate lost");
      followCommit(kind, sink, body);
    }
  });
}

void HttpOutbound::commitHeaders(SendKind kind, const std::shared_ptr<SendSink>& sink, BodyFactory body) {
  const bool awaitCommit = _config.headerOrdering == HeaderOrdering::AwaitCommit;

  auto onCommitted = [this, kind, awaitCommit, sink, body = std::move(body)](SendResult result) {
    if (awaitCommit) {
      _commitLatch.settle(result);
    }
    if (!result) {
      log::debug("{} {} header commit failed: {}", toString(), SendKindName(kind), result.error().message());
      sink->finish(std::move(result));
      return;
    }
    if (!body) {
      sink->complete();
      return;
    }
    if (sink->isActive()) {
      streamBody(kind, body, sink);
    }
  };

  try {
    // Detached from the winner's subscription: losers rely on the header write even if the winner is cancelled.
    _transport->commitHeaders().subscribe(std::move(onCommitted));
  } catch (const std::exception& ex) {
    log::error("{} header commit could not start: {}", toString(), ex.what());
    SendError error(SendErrc::HeaderCommitFailure, ex.what());
    if (awaitCommit) {
      _commitLatch.settle(SendResult(std::unexpect, error));
    }
    sink->fail(std::move(error));
  }
}

void HttpOutbound::followCommit(SendKind kind, const std::shared_ptr<SendSink>& sink, BodyFactory body) {
  if (_config.headerOrdering == HeaderOrdering::TransportSerialized) {
    if (body) {
      streamBody(kind, body, sink);
    } else {
      sink->complete();
    }
    return;
  }
  _commitLatch.await([this, kind, sink, body = std::move(body)](const SendResult& outcome) {
    if (!outcome) {
      sink->fail(SendError(SendErrc::HeaderCommitFailure, std::string(outcome.error().message())));
      return;
    }
    if (!body) {
      sink->complete();
      return;
    }
    if (sink->isActive()) {
      streamBody(kind, body, sink);
    }
  });
}

void HttpOutbound::streamBody(SendKind kind, const BodyFactory& body, const std::shared_ptr<SendSink>& sink) {
  try {
    SendUnit::Relay(body(), sink);
  } catch (const std::exception& ex) {
    log::error("{} {} could not start: {}", toString(), SendKindName(kind), ex.what());
    sink->fail(SendError(SendErrc::BodyStreamFailure, ex.what()));
  }
}

void HttpOutbound::trace(SendKind kind, std::string_view path) const {
  if (_config.traceSends) {
    log::debug("{} {} send: {}", toString(), SendKindName(kind), path);
  }
}

}  // namespace herald
