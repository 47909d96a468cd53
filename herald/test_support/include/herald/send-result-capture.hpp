#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>

#include "herald/send-error.hpp"
#include "herald/send-unit.hpp"

namespace herald::test {

// Records the terminal signals delivered to a send unit consumer.
// Thread safe, and callback() can be handed to several subscriptions.
class SendResultCapture {
 public:
  SendCallback callback() {
    return [this](SendResult result) {
      {
        std::scoped_lock lock(_mutex);
        ++_nbSignals;
        if (!result) {
          ++_nbFailures;
        }
        _last.emplace(std::move(result));
      }
      _cv.notify_all();
    };
  }

  // Waits until at least 'nbSignals' signals were received. Returns false on timeout.
  bool waitFor(std::size_t nbSignals, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::unique_lock lock(_mutex);
    return _cv.wait_for(lock, timeout, [this, nbSignals] { return _nbSignals >= nbSignals; });
  }

  [[nodiscard]] std::size_t nbSignals() const {
    std::scoped_lock lock(_mutex);
    return _nbSignals;
  }

  [[nodiscard]] std::size_t nbFailures() const {
    std::scoped_lock lock(_mutex);
    return _nbFailures;
  }

  [[nodiscard]] bool succeeded() const {
    std::scoped_lock lock(_mutex);
    return _last && _last->has_value();
  }

  // Error code of the last signal, if it was a failure.
  [[nodiscard]] std::optional<SendErrc> errc() const {
    std::scoped_lock lock(_mutex);
    if (!_last || _last->has_value()) {
      return std::nullopt;
    }
    return _last->error().code();
  }

  [[nodiscard]] std::optional<SendResult> last() const {
    std::scoped_lock lock(_mutex);
    return _last;
  }

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::optional<SendResult> _last;
  std::size_t _nbSignals{0};
  std::size_t _nbFailures{0};
};

}  // namespace herald::test
