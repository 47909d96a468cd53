#pragma once

#include <atomic>
#include <cstdint>

namespace herald {

// Single-winner guard around the header commit of one exchange.
//
// The state moves once from NotSent to Sent, with a compare-and-swap, and never reverts.
// Exactly one tryWin() call returns true over the lifetime of the gate, all the others (concurrent or later)
// return false. A loss is a normal outcome, not an error.
class SendGate {
 public:
  SendGate() noexcept = default;

  // Gate continuing a previous exchange of the same connection: it starts closed if headers were already sent.
  explicit SendGate(bool headersSent) noexcept : _state(headersSent ? State::Sent : State::NotSent) {}

  SendGate(const SendGate&) = delete;
  SendGate& operator=(const SendGate&) = delete;

  // Marks the headers sent. Returns true only for the call performing the transition.
  [[nodiscard]] bool tryWin() noexcept {
    State expected = State::NotSent;
    return _state.compare_exchange_strong(expected, State::Sent, std::memory_order_acq_rel, std::memory_order_acquire);
  }

  // Plain read, ordered after the winning compare-and-swap.
  [[nodiscard]] bool hasSentHeaders() const noexcept { return _state.load(std::memory_order_acquire) == State::Sent; }

 private:
  enum class State : std::uint8_t { NotSent, Sent };

  std::atomic<State> _state{State::NotSent};
};

}  // namespace herald
