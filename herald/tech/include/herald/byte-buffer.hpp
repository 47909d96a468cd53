#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace herald {

// Growable byte buffer carrying one outbound payload element (body chunk, rendered head, frame).
// Memory is released with the buffer; copies are deep.
class ByteBuffer {
 public:
  using value_type = std::byte;
  using size_type = std::size_t;
  using pointer = value_type *;
  using const_pointer = const value_type *;
  using iterator = value_type *;
  using const_iterator = const value_type *;

  ByteBuffer() noexcept = default;

  // Empty buffer with at least 'capacity' bytes of storage.
  explicit ByteBuffer(size_type capacity);

  explicit ByteBuffer(std::span<const std::byte> data);

  // Convenience for text payloads, bytes are copied as is.
  explicit ByteBuffer(std::string_view data);

  ByteBuffer(const ByteBuffer &rhs);
  ByteBuffer(ByteBuffer &&rhs) noexcept;

  ByteBuffer &operator=(const ByteBuffer &rhs);
  ByteBuffer &operator=(ByteBuffer &&rhs) noexcept;

  ~ByteBuffer();

  void append(const_pointer data, size_type sz);

  void append(std::span<const std::byte> data) { append(data.data(), data.size()); }

  void append(std::string_view data) { append(reinterpret_cast<const_pointer>(data.data()), data.size()); }

  void push_back(value_type byte);

  void push_back(char ch) { push_back(static_cast<value_type>(ch)); }

  void clear() noexcept { _size = 0; }

  void reserve(size_type newCapacity);

  // Makes room for 'availableCapacity' more bytes, doubling the storage when it grows.
  void ensureAvailableCapacity(size_type availableCapacity);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  value_type &operator[](size_type pos) { return _buf[pos]; }
  value_type operator[](size_type pos) const { return _buf[pos]; }

  [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return {_buf, _size}; }

  [[nodiscard]] std::string_view asStringView() const noexcept {
    return {reinterpret_cast<const char *>(_buf), _size};
  }

  void swap(ByteBuffer &rhs) noexcept;

  bool operator==(const ByteBuffer &rhs) const noexcept;

 private:
  void reallocUp(size_type newCapacity);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(ByteBuffer &lhs, ByteBuffer &rhs) noexcept { lhs.swap(rhs); }

}  // namespace herald
