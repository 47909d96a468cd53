#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace herald {

// Lazy, cold sequence of payload elements.
// Nothing is produced until open() is called, and each open() starts an independent traversal.
template <class T>
class PayloadStream {
 public:
  using value_type = T;

  // One traversal of the sequence. Returns std::nullopt once exhausted.
  using Cursor = std::function<std::optional<T>()>;

  // Called once per traversal.
  using CursorFactory = std::function<Cursor()>;

  // Empty sequence.
  PayloadStream() = default;

  explicit PayloadStream(CursorFactory factory) : _factory(std::move(factory)) {}

  static PayloadStream Empty() { return PayloadStream(); }

  // Sequence over the given items. Each traversal yields copies, 'items' is kept untouched.
  static PayloadStream Of(std::vector<T> items) {
    auto shared = std::make_shared<const std::vector<T>>(std::move(items));
    return PayloadStream([shared]() -> Cursor {
      return [shared, pos = std::size_t{0}]() mutable -> std::optional<T> {
        if (pos == shared->size()) {
          return std::nullopt;
        }
        return (*shared)[pos++];
      };
    });
  }

  static PayloadStream FromGenerator(CursorFactory factory) { return PayloadStream(std::move(factory)); }

  // Lazily transforms each element with 'fn'. 'fn' is only called while a traversal pulls elements.
  template <class Func>
  auto map(Func fn) const -> PayloadStream<std::invoke_result_t<Func &, T &&>> {
    using U = std::invoke_result_t<Func &, T &&>;
    using MappedCursor = typename PayloadStream<U>::Cursor;
    return PayloadStream<U>([factory = _factory, fn = std::move(fn)]() -> MappedCursor {
      if (!factory) {
        return []() -> std::optional<U> { return std::nullopt; };
      }
      return [cursor = factory(), fn]() mutable -> std::optional<U> {
        std::optional<T> item = cursor();
        if (!item) {
          return std::nullopt;
        }
        return std::invoke(fn, std::move(*item));
      };
    });
  }

  // Starts a new traversal.
  [[nodiscard]] Cursor open() const {
    if (!_factory) {
      return []() -> std::optional<T> { return std::nullopt; };
    }
    return _factory();
  }

 private:
  CursorFactory _factory;
};

}  // namespace herald
