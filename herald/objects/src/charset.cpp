#include "herald/charset.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "herald/byte-buffer.hpp"
#include "herald/string-equal-ignore-case.hpp"

namespace herald {

namespace {

constexpr char32_t kReplacementChar = U'?';

struct NamedCharset {
  std::string_view name;
  Charset charset;
};

constexpr NamedCharset kCharsetAliases[] = {
    {"UTF-8", Charset::utf8},           {"UTF8", Charset::utf8},          {"ISO-8859-1", Charset::iso8859_1},
    {"ISO8859-1", Charset::iso8859_1},  {"LATIN1", Charset::iso8859_1},   {"US-ASCII", Charset::usascii},
    {"ASCII", Charset::usascii},        {"UTF-16BE", Charset::utf16be},   {"UTF-16LE", Charset::utf16le},
};

// Decodes one code point from the front of 'text' and advances it.
// Malformed or truncated sequences consume a single byte and yield kReplacementChar.
char32_t DecodeNext(std::string_view& text) {
  const auto lead = static_cast<unsigned char>(text.front());
  std::size_t len;
  char32_t cp;
  if (lead < 0x80U) {
    text.remove_prefix(1);
    return lead;
  }
  if ((lead & 0xE0U) == 0xC0U) {
    len = 2;
    cp = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    len = 3;
    cp = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    len = 4;
    cp = lead & 0x07U;
  } else {
    text.remove_prefix(1);
    return kReplacementChar;
  }
  if (text.size() < len) {
    text.remove_prefix(1);
    return kReplacementChar;
  }
  for (std::size_t pos = 1; pos < len; ++pos) {
    const auto cont = static_cast<unsigned char>(text[pos]);
    if ((cont & 0xC0U) != 0x80U) {
      text.remove_prefix(1);
      return kReplacementChar;
    }
    cp = (cp << 6) | (cont & 0x3FU);
  }
  static constexpr char32_t kMinForLen[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLen[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    // overlong encoding, out of range or surrogate
    text.remove_prefix(1);
    return kReplacementChar;
  }
  text.remove_prefix(len);
  return cp;
}

void AppendUtf16Unit(ByteBuffer& out, std::uint16_t unit, bool bigEndian) {
  const auto hi = static_cast<std::byte>(unit >> 8);
  const auto lo = static_cast<std::byte>(unit & 0xFFU);
  if (bigEndian) {
    out.push_back(hi);
    out.push_back(lo);
  } else {
    out.push_back(lo);
    out.push_back(hi);
  }
}

}  // namespace

std::optional<Charset> CharsetFromName(std::string_view name) {
  for (const auto& alias : kCharsetAliases) {
    if (CaseInsensitiveEqual(alias.name, name)) {
      return alias.charset;
    }
  }
  return std::nullopt;
}

std::size_t MaxEncodedSize(std::string_view utf8Text, Charset charset) noexcept {
  switch (charset) {
    case Charset::utf16be:
      [[fallthrough]];
    case Charset::utf16le:
      // each input byte yields at most one UTF-16 unit; 4-byte sequences yield two units
      return utf8Text.size() * 2U;
    default:
      return utf8Text.size();
  }
}

void EncodeText(std::string_view utf8Text, Charset charset, ByteBuffer& out) {
  out.ensureAvailableCapacity(MaxEncodedSize(utf8Text, charset));
  while (!utf8Text.empty()) {
    const std::string_view before = utf8Text;
    const char32_t cp = DecodeNext(utf8Text);
    switch (charset) {
      case Charset::utf8:
        if (cp == kReplacementChar) {
          out.push_back(static_cast<std::byte>(kReplacementChar));
        } else {
          out.append(before.substr(0, before.size() - utf8Text.size()));
        }
        break;
      case Charset::iso8859_1:
        out.push_back(static_cast<std::byte>(cp <= 0xFF ? cp : kReplacementChar));
        break;
      case Charset::usascii:
        out.push_back(static_cast<std::byte>(cp <= 0x7F ? cp : kReplacementChar));
        break;
      case Charset::utf16be:
        [[fallthrough]];
      case Charset::utf16le: {
        const bool bigEndian = charset == Charset::utf16be;
        if (cp < 0x10000) {
          AppendUtf16Unit(out, static_cast<std::uint16_t>(cp), bigEndian);
        } else {
          const char32_t offset = cp - 0x10000;
          AppendUtf16Unit(out, static_cast<std::uint16_t>(0xD800 + (offset >> 10)), bigEndian);
          AppendUtf16Unit(out, static_cast<std::uint16_t>(0xDC00 + (offset & 0x3FF)), bigEndian);
        }
        break;
      }
      default:
        out.push_back(static_cast<std::byte>(kReplacementChar));
        break;
    }
  }
}

}  // namespace herald
