#include "herald/connection-outbound.hpp"

#include <charconv>
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "herald/byte-buffer.hpp"
#include "herald/http-constants.hpp"
#include "herald/http-status-code.hpp"
#include "herald/invalid-argument.hpp"
#include "herald/log.hpp"
#include "herald/outbound-object.hpp"
#include "herald/outbound-sink.hpp"
#include "herald/payload-stream.hpp"
#include "herald/response-head.hpp"
#include "herald/send-error.hpp"
#include "herald/send-unit.hpp"
#include "herald/string-equal-ignore-case.hpp"
#include "herald/websocket-frame.hpp"
#include "herald/write-queue.hpp"

namespace herald {

namespace {

// Producer writing 'data' once.
WriteQueue::Producer Once(ByteBuffer data) {
  return [data = std::move(data), done = false]() mutable -> std::optional<ByteBuffer> {
    if (done) {
      return std::nullopt;
    }
    done = true;
    return std::move(data);
  };
}

}  // namespace

ConnectionOutbound::ConnectionOutbound(OutboundSink& sink, ResponseHead head, bool websocketUpgrade)
    : _sink(&sink), _head(std::move(head)), _queue(true), _websocketUpgrade(websocketUpgrade) {}

ConnectionOutbound::~ConnectionOutbound() {
  if (_queue.pendingEntries() != 0) {
    log::warn("connection outbound destroyed with {} pending writes", _queue.pendingEntries());
  }
  _queue.close();
}

SendUnit ConnectionOutbound::commitHeaders() {
  return SendUnit([this](const std::shared_ptr<SendSink>& sink) {
    if (isDisposed()) {
      sink->fail(SendError::AlreadyClosed());
      return;
    }
    bool expected = false;
    if (!_headCommitted.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      sink->fail(SendError(SendErrc::HeaderCommitFailure, "headers already committed on this connection"));
      return;
    }

    if (!_websocketUpgrade) {
      const auto transferEncoding = _head.headerValue(http::TransferEncoding);
      if (transferEncoding) {
        _chunked.store(CaseInsensitiveEqual(*transferEncoding, http::chunked), std::memory_order_release);
      } else if (!_head.hasHeader(http::ContentLength) && http::StatusAllowsBody(_head.statusCode())) {
        _head.addHeader(http::TransferEncoding, http::chunked);
        _chunked.store(true, std::memory_order_release);
      }
    }

    ByteBuffer rendered;
    _head.render(rendered);
    log::debug("committing {} head of {} bytes{}", _head.statusCode(), rendered.size(), chunked() ? " (chunked)" : "");
    _queue.enqueue(WriteQueue::EntryKind::Head, Once(std::move(rendered)), sink);
  });
}

SendUnit ConnectionOutbound::streamBytes(PayloadStream<ByteBuffer> payload) {
  return SendUnit([this, payload = std::move(payload)](const std::shared_ptr<SendSink>& sink) {
    if (isDisposed()) {
      sink->fail(SendError::AlreadyClosed());
      return;
    }
    _queue.enqueue(
        WriteQueue::EntryKind::Body,
        [this, cursor = payload.open()]() mutable -> std::optional<ByteBuffer> {
          std::optional<ByteBuffer> data = cursor();
          if (!data) {
            return std::nullopt;
          }
          return frameBody(std::move(*data));
        },
        sink);
  });
}

SendUnit ConnectionOutbound::streamObjects(PayloadStream<OutboundObject> payload) {
  return SendUnit([this, payload = std::move(payload)](const std::shared_ptr<SendSink>& sink) {
    if (isDisposed()) {
      sink->fail(SendError::AlreadyClosed());
      return;
    }
    _queue.enqueue(
        WriteQueue::EntryKind::Body,
        [this, cursor = payload.open()]() mutable -> std::optional<ByteBuffer> {
          std::optional<OutboundObject> object = cursor();
          if (!object) {
            return std::nullopt;
          }
          return frameObject(std::move(*object));
        },
        sink);
  });
}

SendUnit ConnectionOutbound::end() {
  return SendUnit([this](const std::shared_ptr<SendSink>& sink) {
    if (isDisposed()) {
      sink->fail(SendError::AlreadyClosed());
      return;
    }
    bool expected = false;
    if (!_ended.compare_exchange_strong(expected, true, std::memory_order_acq_rel) || !chunked()) {
      sink->complete();
      return;
    }
    _queue.enqueue(WriteQueue::EntryKind::Body, Once(ByteBuffer(http::LastChunk)), sink);
  });
}

std::size_t ConnectionOutbound::flush() {
  const std::size_t written = _queue.flush(*_sink);
  if (_queue.broken()) {
    _disposed.store(true, std::memory_order_release);
  }
  return written;
}

void ConnectionOutbound::dispose() {
  _disposed.store(true, std::memory_order_release);
  _queue.close();
}

ByteBuffer ConnectionOutbound::frameBody(ByteBuffer data) const {
  if (!chunked() || data.empty()) {
    // an empty chunk would terminate the body, skip it
    return data;
  }
  char sizeBuf[2 * sizeof(std::size_t)];
  const auto res = std::to_chars(sizeBuf, sizeBuf + sizeof(sizeBuf), data.size(), 16);
  const std::string_view sizeHex(sizeBuf, static_cast<std::size_t>(res.ptr - sizeBuf));

  ByteBuffer framed(sizeHex.size() + http::CRLF.size() + data.size() + http::CRLF.size());
  framed.append(sizeHex);
  framed.append(http::CRLF);
  framed.append(data.bytes());
  framed.append(http::CRLF);
  return framed;
}

ByteBuffer ConnectionOutbound::frameObject(OutboundObject object) const {
  if (auto* bytes = std::get_if<ByteBuffer>(&object)) {
    return frameBody(std::move(*bytes));
  }
  if (!_websocketUpgrade) {
    throw invalid_argument("websocket frames can only be sent on an upgraded connection");
  }
  ByteBuffer out;
  std::visit(
      [&out](const auto& frame) {
        if constexpr (!std::is_same_v<std::decay_t<decltype(frame)>, ByteBuffer>) {
          websocket::AppendFrame(out, frame);
        }
      },
      object);
  return out;
}

}  // namespace herald
