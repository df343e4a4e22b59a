#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vermouth/form-values.hpp"
#include "vermouth/path-params.hpp"

#ifdef VERMOUTH_ENABLE_GLAZE
#include "vermouth/json-serializer.hpp"
#endif

namespace vermouth {

class RequestBuilder;

// Outcome of a body consuming call on HttpRequest.
enum class BodyDecodeStatus : std::uint8_t {
  Ok,
  NoBody,           // the request carries no body bytes (the body is still considered consumed)
  AlreadyConsumed,  // a previous decode / read call already consumed the body
  Malformed         // the body could not be decoded in the requested format
};

std::string_view BodyDecodeStatusToString(BodyDecodeStatus status) noexcept;

// Read-only view of one decoded HTTP request, built once per connection by RequestBuilder.
// Handlers only see accessors, plus the body consuming calls (readBody, decodeForm, decodeJson),
// exactly one of which can succeed for a given request.
class HttpRequest {
 public:
  // The method token, exactly as received (GET, POST, ...).
  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // The raw request path, without query string.
  // Example:
  //  GET /path?key=val -> '/path'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // The raw query string (after '?'), empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // Query string decoded as application/x-www-form-urlencoded.
  // Returns std::nullopt if the query contains an invalid percent escape.
  [[nodiscard]] std::optional<FormValues> queryParams() const { return FormValues::Parse(_query); }

  // The version token of the request line ("HTTP/1.0" when absent).
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Value captured by the matched route for parameter 'name' (":name" or ":name*").
  // Returns an empty string_view if the route pattern has no such parameter.
  [[nodiscard]] std::string_view pathParam(std::string_view name) const noexcept {
    return _pathParams.find(name).value_or("");
  }

  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  // Value of the header 'name', looked up case-insensitively.
  //  * std::nullopt      => header not present in the request.
  //  * engaged empty     => header present with an empty value.
  // When a header name is repeated, the last occurrence wins.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Like headerValue(), but returns an empty string_view for absent headers.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or("");
  }

  // Headers as received (names keep their original case), one entry per distinct name.
  [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view host() const noexcept;

  [[nodiscard]] std::string_view userAgent() const noexcept;

  [[nodiscard]] std::string_view accept() const noexcept;

  // 'Sec-CH-UA-Platform' client hint with its surrounding double quotes removed ("Linux" -> Linux).
  [[nodiscard]] std::string_view platform() const noexcept;

  // Returns true if the body has not been consumed yet.
  [[nodiscard]] bool hasBody() const noexcept { return !_bodyConsumed && !_body.empty(); }

  // Moves the raw body bytes into 'out' and marks the body as consumed.
  [[nodiscard]] BodyDecodeStatus readBody(std::string& out);

  // Consumes the body and decodes it as application/x-www-form-urlencoded into 'out'.
  [[nodiscard]] BodyDecodeStatus decodeForm(FormValues& out);

#ifdef VERMOUTH_ENABLE_GLAZE
  // Consumes the body and decodes it as JSON into 'out'.
  template <class T>
  [[nodiscard]] BodyDecodeStatus decodeJson(T& out) {
    std::string body;
    const BodyDecodeStatus status = readBody(body);
    if (status != BodyDecodeStatus::Ok) {
      return status;
    }
    return DeserializeFromJson(body, out) ? BodyDecodeStatus::Ok : BodyDecodeStatus::Malformed;
  }
#endif

 private:
  friend class RequestBuilder;

  std::string _method;
  std::string _path;
  std::string _query;
  std::string _version;
  std::vector<std::pair<std::string, std::string>> _headers;
  std::string _body;
  PathParams _pathParams;
  bool _bodyConsumed{false};
};

}  // namespace vermouth
