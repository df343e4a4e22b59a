#pragma once

#include <string_view>

#include "vermouth/http-request.hpp"
#include "vermouth/path-params.hpp"

namespace vermouth {

// Internal producer of HttpRequest objects. Only the request decoder and the connection
// dispatcher use it: handlers never get write access to a request.
class RequestBuilder {
 public:
  RequestBuilder& method(std::string_view method);

  // Splits 'target' at the first '?' into path and query.
  RequestBuilder& target(std::string_view target);

  RequestBuilder& version(std::string_view version);

  // Adds a header. The value of a header with the same name (case-insensitive) is replaced,
  // keeping the name and the position of its first occurrence.
  RequestBuilder& header(std::string_view name, std::string_view value);

  RequestBuilder& body(std::string_view body);

  // Moves the request out. The builder is left empty.
  [[nodiscard]] HttpRequest build();

  // Attaches the parameters captured by the matched route to an already built request.
  static void AttachPathParams(HttpRequest& request, PathParams pathParams) noexcept;

 private:
  HttpRequest _request;
};

}  // namespace vermouth
