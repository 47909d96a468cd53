#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "herald/send-error.hpp"

namespace herald {

// One-shot completion signal of the header commit of an exchange, used with HeaderOrdering::AwaitCommit.
// The gate winner settles it with its commit outcome, losers register waiters on it.
class HeaderCommitLatch {
 public:
  using Waiter = std::function<void(const SendResult&)>;

  HeaderCommitLatch() = default;

  HeaderCommitLatch(const HeaderCommitLatch&) = delete;
  HeaderCommitLatch& operator=(const HeaderCommitLatch&) = delete;

  // Records the outcome and runs the pending waiters, in registration order. Later calls are ignored.
  // Returns true if this call settled the latch.
  bool settle(SendResult outcome);

  // Runs 'waiter' once the latch is settled, immediately if it already is.
  void await(Waiter waiter);

  [[nodiscard]] bool settled() const;

 private:
  mutable std::mutex _mutex;
  std::optional<SendResult> _outcome;
  std::vector<Waiter> _waiters;
};

}  // namespace herald
