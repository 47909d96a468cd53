#include "herald/header-commit-latch.hpp"

#include <mutex>
#include <utility>
#include <vector>

#include "herald/send-error.hpp"

namespace herald {

bool HeaderCommitLatch::settle(SendResult outcome) {
  std::vector<Waiter> waiters;
  {
    std::scoped_lock lock(_mutex);
    if (_outcome) {
      return false;
    }
    _outcome.emplace(std::move(outcome));
    waiters.swap(_waiters);
  }
  // _outcome is never modified again, it can be read without the lock
  for (auto& waiter : waiters) {
    waiter(*_outcome);
  }
  return true;
}

void HeaderCommitLatch::await(Waiter waiter) {
  {
    std::scoped_lock lock(_mutex);
    if (!_outcome) {
      _waiters.push_back(std::move(waiter));
      return;
    }
  }
  waiter(*_outcome);
}

bool HeaderCommitLatch::settled() const {
  std::scoped_lock lock(_mutex);
  return _outcome.has_value();
}

}  // namespace herald
