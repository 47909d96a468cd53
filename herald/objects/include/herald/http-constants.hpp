#pragma once

#include <string_view>

namespace herald::http {

// Header field names are stored in their canonical form for emission.
// Comparisons must stay case-insensitive (RFC 7230).

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard Header Field Names
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";

// Header values
inline constexpr std::string_view chunked = "chunked";

// Framing
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view LastChunk = "0\r\n\r\n";

}  // namespace herald::http
