#include "herald/response-head.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "herald/byte-buffer.hpp"
#include "herald/http-constants.hpp"
#include "herald/http-status-code.hpp"
#include "herald/invalid-argument.hpp"
#include "herald/string-equal-ignore-case.hpp"

namespace herald {

namespace {

constexpr std::size_t kStatusCodeDigits = 3;

bool IsValidFieldName(std::string_view name) {
  return !name.empty() && std::ranges::none_of(name, [](char ch) {
    return ch == ':' || ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
  });
}

bool IsValidFieldValue(std::string_view value) {
  return std::ranges::none_of(value, [](char ch) { return ch == '\r' || ch == '\n'; });
}

void CheckField(std::string_view name, std::string_view value) {
  if (!IsValidFieldName(name)) {
    throw invalid_argument("ResponseHead: invalid header name '{}'", name);
  }
  if (!IsValidFieldValue(value)) {
    throw invalid_argument("ResponseHead: header value of '{}' contains CR or LF", name);
  }
}

}  // namespace

ResponseHead::ResponseHead(http::StatusCode code) : _statusCode(http::StatusCodeOK) { status(code); }

ResponseHead& ResponseHead::status(http::StatusCode code) {
  if (code < 100 || code > 999) {
    throw invalid_argument("ResponseHead: status code must be a 3 digits integer");
  }
  _statusCode = code;
  _reason.reset();
  return *this;
}

ResponseHead& ResponseHead::status(http::StatusCode code, std::string_view reason) {
  status(code);
  return this->reason(reason);
}

ResponseHead& ResponseHead::reason(std::string_view reason) {
  if (!IsValidFieldValue(reason)) {
    throw invalid_argument("ResponseHead: reason phrase contains CR or LF");
  }
  _reason.emplace(reason);
  return *this;
}

ResponseHead& ResponseHead::version(std::string_view version) {
  if (version != http::HTTP10Sv && version != http::HTTP11Sv) {
    throw invalid_argument("ResponseHead: unsupported version '{}'", version);
  }
  _version.assign(version);
  return *this;
}

ResponseHead& ResponseHead::addHeader(std::string_view name, std::string_view value) {
  CheckField(name, value);
  _headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

ResponseHead& ResponseHead::header(std::string_view name, std::string_view value) {
  CheckField(name, value);
  auto it = std::ranges::find_if(_headers, [name](const HeaderField& field) {
    return CaseInsensitiveEqual(field.first, name);
  });
  if (it == _headers.end()) {
    _headers.emplace_back(std::string(name), std::string(value));
  } else {
    it->second.assign(value);
  }
  return *this;
}

ResponseHead& ResponseHead::contentLength(std::size_t len) {
  char buf[24];
  // 24 chars always hold a 64 bits integer
  const auto res = std::to_chars(buf, buf + sizeof(buf), len);
  return header(http::ContentLength, std::string_view(buf, static_cast<std::size_t>(res.ptr - buf)));
}

std::size_t ResponseHead::removeHeader(std::string_view name) {
  return std::erase_if(_headers, [name](const HeaderField& field) { return CaseInsensitiveEqual(field.first, name); });
}

std::optional<std::string_view> ResponseHead::headerValue(std::string_view name) const noexcept {
  for (const auto& [fieldName, fieldValue] : _headers) {
    if (CaseInsensitiveEqual(fieldName, name)) {
      return std::string_view(fieldValue);
    }
  }
  return std::nullopt;
}

std::string_view ResponseHead::reason() const noexcept {
  if (_reason) {
    return *_reason;
  }
  return http::ReasonPhraseFor(_statusCode);
}

std::size_t ResponseHead::renderedSize() const noexcept {
  std::size_t sz = _version.size() + 1U + kStatusCodeDigits + 1U + reason().size() + http::CRLF.size();
  for (const auto& [name, value] : _headers) {
    sz += name.size() + http::HeaderSep.size() + value.size() + http::CRLF.size();
  }
  return sz + http::CRLF.size();
}

void ResponseHead::render(ByteBuffer& out) const {
  out.ensureAvailableCapacity(renderedSize());

  char codeBuf[kStatusCodeDigits];
  std::to_chars(codeBuf, codeBuf + kStatusCodeDigits, _statusCode);

  out.append(std::string_view(_version));
  out.push_back(' ');
  out.append(std::string_view(codeBuf, kStatusCodeDigits));
  out.push_back(' ');
  out.append(reason());
  out.append(http::CRLF);
  for (const auto& [name, value] : _headers) {
    out.append(std::string_view(name));
    out.append(http::HeaderSep);
    out.append(std::string_view(value));
    out.append(http::CRLF);
  }
  out.append(http::CRLF);
}

}  // namespace herald
