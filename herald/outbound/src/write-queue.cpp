#include "herald/write-queue.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "herald/byte-buffer.hpp"
#include "herald/log.hpp"
#include "herald/outbound-sink.hpp"
#include "herald/send-error.hpp"
#include "herald/send-unit.hpp"

namespace herald {

void WriteQueue::enqueue(EntryKind kind, Producer producer, std::shared_ptr<SendSink> sink) {
  {
    std::scoped_lock lock(_mutex);
    if (!closed()) {
      _entries.push_back(Entry{kind, std::move(producer), std::move(sink)});
      return;
    }
  }
  sink->fail(SendError::AlreadyClosed());
}

std::size_t WriteQueue::flush(OutboundSink& out) {
  std::size_t written = 0;
  for (std::optional<Entry> entry = popNext(); entry; entry = popNext()) {
    if (!drain(*entry, out, written)) {
      break;
    }
  }
  return written;
}

void WriteQueue::close() { failPending("This outbound is not active anymore", true); }

std::size_t WriteQueue::pendingEntries() const {
  std::scoped_lock lock(_mutex);
  return _entries.size();
}

std::optional<WriteQueue::Entry> WriteQueue::popNext() {
  std::scoped_lock lock(_mutex);
  if (closed()) {
    return std::nullopt;
  }
  auto it = _entries.begin();
  if (_headFirst && !headWritten()) {
    it = std::ranges::find_if(_entries, [](const Entry& entry) { return entry.kind == EntryKind::Head; });
  }
  if (it == _entries.end()) {
    return std::nullopt;
  }
  std::optional<Entry> ret(std::move(*it));
  _entries.erase(it);
  return ret;
}

bool WriteQueue::drain(Entry& entry, OutboundSink& out, std::size_t& written) {
  while (true) {
    if (entry.kind == EntryKind::Body && entry.sink->isCancelled()) {
      // no new write once the consumer went away, bytes already written stay on the wire.
      // A head is always written: bodies of other senders are held back until it is.
      log::debug("write queue: dropping the rest of a cancelled entry");
      return true;
    }
    std::optional<ByteBuffer> chunk;
    try {
      chunk = entry.producer();
    } catch (const std::exception& ex) {
      log::warn("write queue: payload production failed: {}", ex.what());
      entry.sink->fail(SendError(ErrcFor(entry.kind), ex.what()));
      return true;
    }
    if (!chunk) {
      break;
    }
    if (chunk->empty()) {
      continue;
    }
    if (!out.write(chunk->bytes())) {
      log::error("write queue: sink write of {} bytes failed, closing the connection", chunk->size());
      _broken.store(true, std::memory_order_release);
      entry.sink->fail(SendError(ErrcFor(entry.kind), "connection write failed"));
      failPending("connection write failed", false);
      return false;
    }
    written += chunk->size();
  }
  if (entry.kind == EntryKind::Head) {
    // before completion so that bodies queued by the completion callback can follow in the same flush
    _headWritten.store(true, std::memory_order_release);
  }
  entry.sink->complete();
  return true;
}

void WriteQueue::failPending(std::string_view message, bool released) {
  std::deque<Entry> entries;
  {
    std::scoped_lock lock(_mutex);
    _closed.store(true, std::memory_order_release);
    entries.swap(_entries);
  }
  for (auto& entry : entries) {
    if (released) {
      entry.sink->fail(SendError::AlreadyClosed());
    } else {
      entry.sink->fail(SendError(ErrcFor(entry.kind), std::string(message)));
    }
  }
}

}  // namespace herald
