#include "herald/byte-buffer.hpp"

#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <span>
#include <string_view>
#include <utility>

namespace herald {

ByteBuffer::ByteBuffer(size_type capacity)
    : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

ByteBuffer::ByteBuffer(std::span<const std::byte> data) : ByteBuffer(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

ByteBuffer::ByteBuffer(std::string_view data)
    : ByteBuffer(std::span<const std::byte>(reinterpret_cast<const std::byte *>(data.data()), data.size())) {}

ByteBuffer::ByteBuffer(const ByteBuffer &rhs) : ByteBuffer(rhs.bytes()) {}

ByteBuffer::ByteBuffer(ByteBuffer &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

ByteBuffer &ByteBuffer::operator=(const ByteBuffer &rhs) {
  if (this != &rhs) {
    reserve(rhs.size());
    _size = rhs.size();
    if (_size != 0) {
      std::memcpy(_buf, rhs.data(), _size);
    }
  }
  return *this;
}

ByteBuffer &ByteBuffer::operator=(ByteBuffer &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

ByteBuffer::~ByteBuffer() { std::free(_buf); }

void ByteBuffer::append(const_pointer data, size_type sz) {
  if (sz == 0) {
    return;
  }
  ensureAvailableCapacity(sz);
  std::memcpy(_buf + _size, data, sz);
  _size += sz;
}

void ByteBuffer::push_back(value_type byte) {
  ensureAvailableCapacity(1U);
  _buf[_size++] = byte;
}

void ByteBuffer::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void ByteBuffer::ensureAvailableCapacity(size_type availableCapacity) {
  if (std::numeric_limits<size_type>::max() - _size < availableCapacity) {
    throw std::bad_alloc();
  }
  const size_type required = _size + availableCapacity;
  if (_capacity < required) {
    size_type newCapacity = (_capacity * 2U) + 1U;
    if (newCapacity < required) {
      newCapacity = required;
    }
    reallocUp(newCapacity);
  }
}

void ByteBuffer::swap(ByteBuffer &rhs) noexcept {
  std::swap(_buf, rhs._buf);
  std::swap(_size, rhs._size);
  std::swap(_capacity, rhs._capacity);
}

bool ByteBuffer::operator==(const ByteBuffer &rhs) const noexcept {
  return _size == rhs._size && (_size == 0 || std::memcmp(_buf, rhs._buf, _size) == 0);
}

void ByteBuffer::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace herald
