#include "herald/outbound-config.hpp"

#include <string_view>
#include <type_traits>

#include "herald/charset.hpp"
#include "herald/invalid-argument.hpp"

namespace herald {

std::string_view HeaderOrderingName(HeaderOrdering ordering) noexcept {
  switch (ordering) {
    case HeaderOrdering::TransportSerialized:
      return "TransportSerialized";
    case HeaderOrdering::AwaitCommit:
      return "AwaitCommit";
    default:
      return "unknown";
  }
}

void OutboundConfig::validate() const {
  if (static_cast<std::underlying_type_t<Charset>>(charset) >= kNbCharsets) {
    throw invalid_argument("OutboundConfig: unknown charset");
  }
  if (headerOrdering != HeaderOrdering::TransportSerialized && headerOrdering != HeaderOrdering::AwaitCommit) {
    throw invalid_argument("OutboundConfig: unknown header ordering");
  }
  if (textBufferExtraCapacity > kMaxTextBufferExtraCapacity) {
    throw invalid_argument("OutboundConfig: textBufferExtraCapacity should not exceed 1 MiB");
  }
}

}  // namespace herald
