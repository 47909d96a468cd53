#pragma once

#include <string>

#include "herald/http-method.hpp"

namespace herald {

// Identity of one exchange, fixed for its lifetime. Only used for routing text payloads
// (websocket flag) and for diagnostics.
struct ExchangeInfo {
  http::Method method{http::Method::GET};
  std::string uri{"/"};
  bool websocketUpgrade{false};
};

}  // namespace herald
