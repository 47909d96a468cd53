#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include "herald/byte-buffer.hpp"
#include "herald/outbound-sink.hpp"
#include "herald/send-error.hpp"
#include "herald/send-unit.hpp"

namespace herald {

// Per-connection queue of pending writes.
//
// Entries are written in the order they were enqueued, each one entirely before the next one starts.
// With 'headFirst', body entries are held back until a head entry has been written, so a body enqueued before
// the head (by a concurrent sender) cannot reach the wire first.
//
// enqueue() is thread safe. flush() must only be called by the connection owner, one call at a time.
class WriteQueue {
 public:
  enum class EntryKind : std::uint8_t { Head, Body };

  // Pulled during flush(). Returns the next bytes to write, std::nullopt once the entry is complete.
  using Producer = std::function<std::optional<ByteBuffer>()>;

  explicit WriteQueue(bool headFirst = true) noexcept : _headFirst(headFirst) {}

  WriteQueue(const WriteQueue&) = delete;
  WriteQueue& operator=(const WriteQueue&) = delete;

  // Queues a write. 'sink' completes once all the bytes of the entry were written.
  // If the queue is closed, 'sink' fails at once with AlreadyClosed.
  void enqueue(EntryKind kind, Producer producer, std::shared_ptr<SendSink> sink);

  // Writes the pending entries to 'out'. Entries enqueued by completion callbacks during the flush are written too.
  // Returns the number of bytes written.
  std::size_t flush(OutboundSink& out);

  // Fails all pending entries with AlreadyClosed and rejects future ones.
  void close();

  [[nodiscard]] std::size_t pendingEntries() const;

  [[nodiscard]] bool closed() const noexcept { return _closed.load(std::memory_order_acquire); }

  // True if a write to the sink failed.
  [[nodiscard]] bool broken() const noexcept { return _broken.load(std::memory_order_acquire); }

  [[nodiscard]] bool headWritten() const noexcept { return _headWritten.load(std::memory_order_acquire); }

 private:
  struct Entry {
    EntryKind kind{EntryKind::Body};
    Producer producer;
    std::shared_ptr<SendSink> sink;
  };

  static SendErrc ErrcFor(EntryKind kind) noexcept {
    return kind == EntryKind::Head ? SendErrc::HeaderCommitFailure : SendErrc::BodyStreamFailure;
  }

  std::optional<Entry> popNext();

  // Returns false if the sink failed.
  bool drain(Entry& entry, OutboundSink& out, std::size_t& written);

  // Closes the queue, failing pending entries with 'released' ? AlreadyClosed : the failure matching their kind.
  void failPending(std::string_view message, bool released);

  mutable std::mutex _mutex;
  std::deque<Entry> _entries;
  std::atomic<bool> _closed{false};
  std::atomic<bool> _broken{false};
  std::atomic<bool> _headWritten{false};
  bool _headFirst;
};

}  // namespace herald
