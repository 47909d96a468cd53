#include "herald/recording-transport.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "herald/byte-buffer.hpp"
#include "herald/outbound-object.hpp"
#include "herald/payload-stream.hpp"
#include "herald/send-error.hpp"
#include "herald/send-unit.hpp"
#include "herald/websocket-frame.hpp"

namespace herald::test {

namespace {

std::string_view AsText(std::span<const std::byte> bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string Describe(const ByteBuffer& buffer) {
  std::string ret("bytes:");
  ret.append(buffer.asStringView());
  return ret;
}

std::string Describe(const OutboundObject& object) {
  std::string ret("object:");
  ret.append(OutboundObjectKind(object));
  ret.push_back(':');
  if (const auto* bytes = std::get_if<ByteBuffer>(&object)) {
    ret.append(bytes->asStringView());
  } else if (const auto* text = std::get_if<websocket::TextFrame>(&object)) {
    ret.append(text->text());
  } else {
    ret.append(AsText(std::get<websocket::BinaryFrame>(object).payload()));
  }
  return ret;
}

}  // namespace

SendUnit RecordingTransport::commitHeaders() {
  ++_commitHeadersCalls;
  if (_throwOnCommit.load(std::memory_order_acquire)) {
    throw std::runtime_error("transport refused the header commit");
  }
  return SendUnit([this](const std::shared_ptr<SendSink>& sink) {
    std::optional<std::string> failure;
    {
      std::scoped_lock lock(_mutex);
      failure = _commitFailure;
      if (!failure) {
        _log.emplace_back("commit");
      }
    }
    if (failure) {
      sink->fail(SendError(SendErrc::HeaderCommitFailure, *failure));
      return;
    }
    settle(sink);
  });
}

SendUnit RecordingTransport::streamBytes(PayloadStream<ByteBuffer> payload) {
  ++_streamBytesCalls;
  return SendUnit([this, payload = std::move(payload)](const std::shared_ptr<SendSink>& sink) {
    std::optional<std::string> failure;
    std::size_t okChunks = 0;
    {
      std::scoped_lock lock(_mutex);
      failure = _bodyFailure;
      okChunks = _bodyFailureOkChunks;
    }
    auto cursor = payload.open();
    std::size_t nbChunks = 0;
    for (std::optional<ByteBuffer> chunk = cursor(); chunk; chunk = cursor()) {
      if (failure && nbChunks == okChunks) {
        break;
      }
      record(Describe(*chunk));
      ++nbChunks;
    }
    if (failure) {
      sink->fail(SendError(SendErrc::BodyStreamFailure, *failure));
      return;
    }
    settle(sink);
  });
}

SendUnit RecordingTransport::streamObjects(PayloadStream<OutboundObject> payload) {
  ++_streamObjectsCalls;
  return SendUnit([this, payload = std::move(payload)](const std::shared_ptr<SendSink>& sink) {
    std::optional<std::string> failure;
    std::size_t okChunks = 0;
    {
      std::scoped_lock lock(_mutex);
      failure = _bodyFailure;
      okChunks = _bodyFailureOkChunks;
    }
    auto cursor = payload.open();
    std::size_t nbObjects = 0;
    for (std::optional<OutboundObject> object = cursor(); object; object = cursor()) {
      if (failure && nbObjects == okChunks) {
        break;
      }
      record(Describe(*object));
      ++nbObjects;
    }
    if (failure) {
      sink->fail(SendError(SendErrc::BodyStreamFailure, *failure));
      return;
    }
    settle(sink);
  });
}

ByteBuffer RecordingTransport::allocateBuffer(std::size_t capacity) {
  ++_allocatedBuffers;
  _lastAllocatedCapacity.store(capacity);
  return ByteBuffer(capacity);
}

void RecordingTransport::failCommits(std::string message) {
  std::scoped_lock lock(_mutex);
  _commitFailure = std::move(message);
}

void RecordingTransport::failBodies(std::string message, std::size_t okChunks) {
  std::scoped_lock lock(_mutex);
  _bodyFailure = std::move(message);
  _bodyFailureOkChunks = okChunks;
}

std::size_t RecordingTransport::completePending() {
  std::size_t nbCompleted = 0;
  while (completeNext()) {
    ++nbCompleted;
  }
  return nbCompleted;
}

bool RecordingTransport::completeNext() {
  auto sink = popPending();
  if (!sink) {
    return false;
  }
  sink->complete();
  return true;
}

bool RecordingTransport::failNext(SendError error) {
  auto sink = popPending();
  if (!sink) {
    return false;
  }
  sink->fail(std::move(error));
  return true;
}

std::size_t RecordingTransport::pendingCount() const {
  std::scoped_lock lock(_mutex);
  return _pending.size();
}

std::vector<std::string> RecordingTransport::log() const {
  std::scoped_lock lock(_mutex);
  return _log;
}

std::size_t RecordingTransport::count(std::string_view entry) const {
  std::scoped_lock lock(_mutex);
  return static_cast<std::size_t>(std::count(_log.begin(), _log.end(), entry));
}

void RecordingTransport::record(std::string entry) {
  std::scoped_lock lock(_mutex);
  _log.push_back(std::move(entry));
}

void RecordingTransport::settle(const std::shared_ptr<SendSink>& sink) {
  if (_completion == Completion::Immediate) {
    sink->complete();
    return;
  }
  std::scoped_lock lock(_mutex);
  _pending.push_back(sink);
}

std::shared_ptr<SendSink> RecordingTransport::popPending() {
  std::scoped_lock lock(_mutex);
  if (_pending.empty()) {
    return nullptr;
  }
  auto sink = std::move(_pending.front());
  _pending.erase(_pending.begin());
  return sink;
}

}  // namespace herald::test
