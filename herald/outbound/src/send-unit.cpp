#include "herald/send-unit.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <utility>

#include "herald/send-error.hpp"

namespace herald {

bool SendSink::finish(SendResult result) {
  State expected = State::Active;
  if (!_state.compare_exchange_strong(expected, State::Terminated, std::memory_order_acq_rel,
                                      std::memory_order_acquire)) {
    return false;
  }
  // the stage that produced this outcome is over, nothing left to cancel
  takeCancelHook();
  // only the winner of the transition above touches the callback
  SendCallback callback = std::exchange(_callback, {});
  if (callback) {
    callback(std::move(result));
  }
  return true;
}

void SendSink::cancel() {
  State expected = State::Active;
  if (!_state.compare_exchange_strong(expected, State::Cancelled, std::memory_order_acq_rel,
                                      std::memory_order_acquire)) {
    return;
  }
  _callback = nullptr;
  auto hook = takeCancelHook();
  if (hook) {
    hook();
  }
}

void SendSink::setCancelHook(std::function<void()> hook) {
  {
    std::scoped_lock lock(_hookMutex);
    if (!isCancelled()) {
      _cancelHook = std::move(hook);
      return;
    }
  }
  if (hook) {
    hook();
  }
}

std::function<void()> SendSink::takeCancelHook() {
  std::scoped_lock lock(_hookMutex);
  return std::exchange(_cancelHook, {});
}

SendUnit::SendUnit() : _onSubscribe([](const std::shared_ptr<SendSink>& sink) { sink->complete(); }) {}

SendUnit SendUnit::Failed(SendError error) {
  return SendUnit([error = std::move(error)](const std::shared_ptr<SendSink>& sink) { sink->fail(error); });
}

SendUnit SendUnit::then(Factory next) const {
  return SendUnit([first = *this, next = std::move(next)](const std::shared_ptr<SendSink>& sink) {
    SubscribeStage(first, sink, [sink, next](SendResult result) {
      if (!result) {
        sink->finish(std::move(result));
        return;
      }
      if (!sink->isActive()) {
        return;
      }
      Relay(next(), sink);
    });
  });
}

SendSubscription SendUnit::subscribe(SendCallback callback) const {
  auto sink = std::make_shared<SendSink>(std::move(callback));
  start(sink);
  return SendSubscription(std::move(sink));
}

void SendUnit::SubscribeStage(const SendUnit& unit, const std::shared_ptr<SendSink>& sink, SendCallback onResult) {
  auto stage = std::make_shared<SendSink>(std::move(onResult));
  sink->setCancelHook([weakStage = std::weak_ptr<SendSink>(stage)]() {
    if (auto alive = weakStage.lock()) {
      alive->cancel();
    }
  });
  unit.start(stage);
}

void SendUnit::Relay(const SendUnit& unit, const std::shared_ptr<SendSink>& sink) {
  SubscribeStage(unit, sink, [sink](SendResult result) { sink->finish(std::move(result)); });
}

void SendUnit::start(const std::shared_ptr<SendSink>& sink) const {
  if (!sink->isActive()) {
    return;
  }
  _onSubscribe(sink);
}

}  // namespace herald
