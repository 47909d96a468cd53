#pragma once

#include <string_view>

namespace herald {

constexpr char ToLowerAscii(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (ToLowerAscii(*pLhs) != ToLowerAscii(*pRhs)) {
      return false;
    }
  }
  return true;
}

}  // namespace herald
