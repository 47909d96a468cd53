#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "herald/byte-buffer.hpp"

namespace herald {

// Character encodings available for text payloads. Text chunks are always given as UTF-8.
enum class Charset : std::uint8_t {
  utf8,
  iso8859_1,
  usascii,
  utf16be,
  utf16le,
};

inline constexpr std::underlying_type_t<Charset> kNbCharsets =
    static_cast<std::underlying_type_t<Charset>>(Charset::utf16le) + 1;

// Canonical IANA name.
constexpr std::string_view CharsetName(Charset charset) {
  constexpr std::string_view kCharsetNames[kNbCharsets] = {
      "UTF-8", "ISO-8859-1", "US-ASCII", "UTF-16BE", "UTF-16LE",
  };
  if (static_cast<std::underlying_type_t<Charset>>(charset) >= kNbCharsets) [[unlikely]] {
    return "unknown";
  }
  return kCharsetNames[static_cast<std::underlying_type_t<Charset>>(charset)];
}

// Case-insensitive lookup of a charset by name or common alias ("utf8", "latin1", "ascii").
std::optional<Charset> CharsetFromName(std::string_view name);

// Upper bound of the number of bytes EncodeText may produce for 'utf8Text'.
std::size_t MaxEncodedSize(std::string_view utf8Text, Charset charset) noexcept;

// Appends the encoding of the UTF-8 'utf8Text' to 'out'.
// Characters outside of the target repertoire, and malformed UTF-8 sequences, are replaced by '?'.
void EncodeText(std::string_view utf8Text, Charset charset, ByteBuffer& out);

}  // namespace herald
