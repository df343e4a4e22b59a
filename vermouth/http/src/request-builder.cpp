#include "vermouth/request-builder.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

#include "vermouth/string-equal-ignore-case.hpp"

namespace vermouth {

RequestBuilder& RequestBuilder::method(std::string_view method) {
  _request._method.assign(method);
  return *this;
}

RequestBuilder& RequestBuilder::target(std::string_view target) {
  const auto queryPos = target.find('?');
  if (queryPos == std::string_view::npos) {
    _request._path.assign(target);
    _request._query.clear();
  } else {
    _request._path.assign(target.substr(0, queryPos));
    _request._query.assign(target.substr(queryPos + 1));
  }
  return *this;
}

RequestBuilder& RequestBuilder::version(std::string_view version) {
  _request._version.assign(version);
  return *this;
}

RequestBuilder& RequestBuilder::header(std::string_view name, std::string_view value) {
  auto& headers = _request._headers;
  auto it = std::ranges::find_if(headers, [name](const auto& header) { return CaseInsensitiveEqual(header.first, name); });
  if (it == headers.end()) {
    headers.emplace_back(name, value);
  } else {
    it->second.assign(value);
  }
  return *this;
}

RequestBuilder& RequestBuilder::body(std::string_view body) {
  _request._body.assign(body);
  _request._bodyConsumed = false;
  return *this;
}

HttpRequest RequestBuilder::build() {
  HttpRequest ret = std::move(_request);
  _request = HttpRequest{};
  return ret;
}

void RequestBuilder::AttachPathParams(HttpRequest& request, PathParams pathParams) noexcept {
  request._pathParams = std::move(pathParams);
}

}  // namespace vermouth
