#include "herald/send-error.hpp"

#include <string_view>

namespace herald {

std::string_view SendErrcName(SendErrc errc) noexcept {
  switch (errc) {
    case SendErrc::AlreadyClosed:
      return "AlreadyClosed";
    case SendErrc::HeaderCommitFailure:
      return "HeaderCommitFailure";
    case SendErrc::BodyStreamFailure:
      return "BodyStreamFailure";
    default:
      return "Unknown";
  }
}

}  // namespace herald
