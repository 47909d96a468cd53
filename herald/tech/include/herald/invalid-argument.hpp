#pragma once

#include <format>
#include <stdexcept>
#include <utility>

namespace herald {

// Thrown on invalid configuration or API misuse detected synchronously.
// Asynchronous send outcomes never throw, they are reported through SendResult.
class invalid_argument : public std::invalid_argument {
 public:
  explicit invalid_argument(const char* msg) : std::invalid_argument(msg) {}

  template <typename... Args>
    requires(sizeof...(Args) > 0)
  explicit invalid_argument(std::format_string<Args...> fmt, Args&&... args)
      : std::invalid_argument(std::format(fmt, std::forward<Args>(args)...)) {}
};

}  // namespace herald
