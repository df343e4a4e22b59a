#include "vermouth/http-request.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "vermouth/form-values.hpp"
#include "vermouth/http-constants.hpp"
#include "vermouth/string-equal-ignore-case.hpp"

namespace vermouth {

std::string_view BodyDecodeStatusToString(BodyDecodeStatus status) noexcept {
  switch (status) {
    case BodyDecodeStatus::Ok:
      return "Ok";
    case BodyDecodeStatus::NoBody:
      return "NoBody";
    case BodyDecodeStatus::AlreadyConsumed:
      return "AlreadyConsumed";
    case BodyDecodeStatus::Malformed:
      return "Malformed";
    default:
      return "Unknown";
  }
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_headers, [name](const auto& header) { return CaseInsensitiveEqual(header.first, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::string_view HttpRequest::host() const noexcept { return headerValueOrEmpty(http::Host); }

std::string_view HttpRequest::userAgent() const noexcept { return headerValueOrEmpty(http::UserAgent); }

std::string_view HttpRequest::accept() const noexcept { return headerValueOrEmpty(http::Accept); }

std::string_view HttpRequest::platform() const noexcept {
  std::string_view value = headerValueOrEmpty(http::SecChUaPlatform);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

BodyDecodeStatus HttpRequest::readBody(std::string& out) {
  if (_bodyConsumed) {
    return BodyDecodeStatus::AlreadyConsumed;
  }
  _bodyConsumed = true;
  if (_body.empty()) {
    return BodyDecodeStatus::NoBody;
  }
  out = std::move(_body);
  _body.clear();
  return BodyDecodeStatus::Ok;
}

BodyDecodeStatus HttpRequest::decodeForm(FormValues& out) {
  std::string body;
  const BodyDecodeStatus status = readBody(body);
  if (status != BodyDecodeStatus::Ok) {
    return status;
  }
  auto parsed = FormValues::Parse(body);
  if (!parsed) {
    return BodyDecodeStatus::Malformed;
  }
  out = std::move(*parsed);
  return BodyDecodeStatus::Ok;
}

}  // namespace vermouth
