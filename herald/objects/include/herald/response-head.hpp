#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "herald/byte-buffer.hpp"
#include "herald/http-constants.hpp"
#include "herald/http-status-code.hpp"

namespace herald {

// Status line and header fields of an HTTP/1.x response, rendered once by ConnectionOutbound::commitHeaders().
class ResponseHead {
 public:
  using HeaderField = std::pair<std::string, std::string>;

  explicit ResponseHead(http::StatusCode code = http::StatusCodeOK);

  // Replaces the status code, reason phrase is reset to the default phrase of the code.
  ResponseHead& status(http::StatusCode code);

  ResponseHead& status(http::StatusCode code, std::string_view reason);

  ResponseHead& reason(std::string_view reason);

  // Defaults to HTTP/1.1.
  ResponseHead& version(std::string_view version);

  // Appends a header field, duplicates allowed.
  ResponseHead& addHeader(std::string_view name, std::string_view value);

  // Sets or replaces a header field (case-insensitive name match), keeping the casing of the first occurrence.
  ResponseHead& header(std::string_view name, std::string_view value);

  ResponseHead& contentLength(std::size_t len);

  // Removes all header fields named 'name'. Returns the number of removed fields.
  std::size_t removeHeader(std::string_view name);

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] bool hasHeader(std::string_view name) const noexcept { return headerValue(name).has_value(); }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view reason() const noexcept;

  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] const std::vector<HeaderField>& headers() const noexcept { return _headers; }

  // Number of bytes render() appends.
  [[nodiscard]] std::size_t renderedSize() const noexcept;

  // Appends "<version> <code> <reason>\r\n" then each "<name>: <value>\r\n" then the terminating "\r\n".
  void render(ByteBuffer& out) const;

 private:
  std::string _version{http::HTTP11Sv};
  std::optional<std::string> _reason;
  std::vector<HeaderField> _headers;
  http::StatusCode _statusCode;
};

}  // namespace herald
