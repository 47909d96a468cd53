#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "herald/outbound-sink.hpp"

namespace herald::test {

// OutboundSink accumulating written bytes into a string.
class StringSink : public OutboundSink {
 public:
  bool write(std::span<const std::byte> data) override {
    ++_nbWrites;
    if (_failWrites) {
      return false;
    }
    _out.append(reinterpret_cast<const char*>(data.data()), data.size());
    return true;
  }

  // Makes next writes fail.
  void failWrites(bool value = true) noexcept { _failWrites = value; }

  [[nodiscard]] std::string_view out() const noexcept { return _out; }

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _nbWrites; }

  void clear() noexcept { _out.clear(); }

 private:
  std::string _out;
  std::size_t _nbWrites{0};
  bool _failWrites{false};
};

}  // namespace herald::test
