#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

#include "herald/send-error.hpp"

namespace herald {

// Receives the terminal outcome of a send unit, at most once.
using SendCallback = std::function<void(SendResult)>;

// Consumer side of one attachment to a send unit.
//
// Guarantees a single terminal signal: the first of finish() and cancel() wins, later calls are ignored.
// Thread safe: a sink may be finished by a transport thread while its consumer cancels it from another one.
class SendSink {
 public:
  explicit SendSink(SendCallback callback) : _callback(std::move(callback)) {}

  SendSink(const SendSink&) = delete;
  SendSink& operator=(const SendSink&) = delete;

  ~SendSink() = default;

  // Delivers 'result' to the consumer unless a terminal signal was already delivered or the sink was cancelled.
  // Returns true if this call delivered it.
  bool finish(SendResult result);

  bool complete() { return finish(SendResult{}); }

  bool fail(SendError error) { return finish(SendResult(std::unexpect, std::move(error))); }

  // Detaches the consumer: its callback will never be invoked, and the in-flight stage (if any) is cancelled.
  void cancel();

  // Installs the hook cancelling the in-flight stage, replacing the previous one without invoking it.
  // If the sink is already cancelled, the hook is invoked immediately instead.
  void setCancelHook(std::function<void()> hook);

  [[nodiscard]] bool isCancelled() const noexcept { return _state.load(std::memory_order_acquire) == State::Cancelled; }

  [[nodiscard]] bool isTerminated() const noexcept {
    return _state.load(std::memory_order_acquire) == State::Terminated;
  }

  [[nodiscard]] bool isActive() const noexcept { return _state.load(std::memory_order_acquire) == State::Active; }

 private:
  enum class State : std::uint8_t { Active, Terminated, Cancelled };

  std::function<void()> takeCancelHook();

  SendCallback _callback;
  std::mutex _hookMutex;
  std::function<void()> _cancelHook;
  std::atomic<State> _state{State::Active};
};

// Handle on one attachment, allowing the consumer to cancel it.
class SendSubscription {
 public:
  SendSubscription() noexcept = default;

  explicit SendSubscription(std::shared_ptr<SendSink> sink) noexcept : _sink(std::move(sink)) {}

  // No further writes are issued for this attachment once cancellation is observed, and no signal is delivered.
  // Writes already issued are not rolled back.
  void cancel() {
    if (_sink) {
      _sink->cancel();
    }
  }

  [[nodiscard]] bool isCancelled() const noexcept { return _sink && _sink->isCancelled(); }

  [[nodiscard]] bool isTerminated() const noexcept { return _sink && _sink->isTerminated(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_sink); }

 private:
  std::shared_ptr<SendSink> _sink;
};

// Lazy asynchronous unit of work completing with a SendResult.
//
// Building a unit has no side effect. Work starts when a consumer attaches with subscribe(), and every attachment
// runs the unit from the start, independently of the others.
class SendUnit {
 public:
  // Starts the work for one attachment. Must eventually finish the sink (unless it gets cancelled).
  using OnSubscribe = std::function<void(const std::shared_ptr<SendSink>&)>;

  // Produces the next stage of a composed unit.
  using Factory = std::function<SendUnit()>;

  // A unit completing successfully right away.
  SendUnit();

  explicit SendUnit(OnSubscribe onSubscribe) : _onSubscribe(std::move(onSubscribe)) {}

  static SendUnit Deferred(OnSubscribe onSubscribe) { return SendUnit(std::move(onSubscribe)); }

  static SendUnit Completed() { return {}; }

  static SendUnit Failed(SendError error);

  // Runs this unit, then - only if it succeeded - the unit produced by 'next'.
  // 'next' is not called at all if this unit fails or if the consumer cancelled in the meantime.
  [[nodiscard]] SendUnit then(Factory next) const;

  // Attaches a consumer.
  SendSubscription subscribe(SendCallback callback) const;

  // Attaches 'unit' as the current stage of 'sink': cancelling 'sink' cancels that stage,
  // and its outcome is delivered to 'onResult' instead of the sink.
  static void SubscribeStage(const SendUnit& unit, const std::shared_ptr<SendSink>& sink, SendCallback onResult);

  // Attaches 'unit' as the last stage of 'sink', relaying its outcome verbatim.
  static void Relay(const SendUnit& unit, const std::shared_ptr<SendSink>& sink);

 private:
  void start(const std::shared_ptr<SendSink>& sink) const;

  OnSubscribe _onSubscribe;
};

}  // namespace herald
