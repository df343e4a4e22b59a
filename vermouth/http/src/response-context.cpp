#include "vermouth/response-context.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "vermouth/file.hpp"
#include "vermouth/http-constants.hpp"
#include "vermouth/http-header-is-valid.hpp"
#include "vermouth/http-status-code.hpp"
#include "vermouth/log.hpp"
#include "vermouth/string-equal-ignore-case.hpp"
#include "vermouth/transport.hpp"

namespace vermouth {

std::string_view ResponseStateToString(ResponseContext::State state) noexcept {
  switch (state) {
    case ResponseContext::State::Unstarted:
      return "Unstarted";
    case ResponseContext::State::HeaderSent:
      return "HeaderSent";
    case ResponseContext::State::Flushed:
      return "Flushed";
    default:
      return "Unknown";
  }
}

void ResponseContext::ensureUnstarted(std::string_view operation) const {
  if (_state != State::Unstarted) {
    throw std::logic_error(std::string(operation) + " called after the response status line was sent (state " +
                           std::string(ResponseStateToString(_state)) + ")");
  }
}

void ResponseContext::setHeaderUnchecked(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_headers, [name](const auto& header) { return CaseInsensitiveEqual(header.first, name); });
  if (it == _headers.end()) {
    _headers.emplace_back(name, value);
  } else {
    it->second.assign(value);
  }
}

ResponseContext& ResponseContext::setHeader(std::string_view name, std::string_view value) {
  ensureUnstarted("setHeader");
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument("Invalid response header name '" + std::string(name) + "'");
  }
  if (!http::IsValidHeaderValue(value)) {
    throw std::invalid_argument("Invalid value for response header '" + std::string(name) + "'");
  }
  setHeaderUnchecked(name, value);
  return *this;
}

std::string_view ResponseContext::headerValueOrEmpty(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_headers, [name](const auto& header) { return CaseInsensitiveEqual(header.first, name); });
  return it == _headers.end() ? std::string_view{} : std::string_view(it->second);
}

void ResponseContext::respond(http::StatusCode status, std::string_view contentType, std::string_view body) {
  ensureUnstarted("response");

  if (!contentType.empty()) {
    setHeaderUnchecked(http::ContentType, contentType);
  }
  setHeaderUnchecked(http::ContentLength, std::to_string(body.size()));

  std::string head;
  head.append(http::HTTP11Sv);
  head.push_back(' ');
  head.append(std::to_string(status));
  head.push_back(' ');
  head.append(http::ReasonPhraseFor(status));
  head.append(http::CRLF);

  // From here on, the header set is frozen.
  _status = status;
  _state = State::HeaderSent;

  for (const auto& [name, value] : _headers) {
    head.append(name);
    head.append(http::HeaderSep);
    head.append(value);
    head.append(http::CRLF);
  }
  head.append(http::CRLF);

  const auto [bytesWritten, want] = _transport.write(head, body);
  if (bytesWritten != head.size() + body.size()) {
    const auto errc = want == TransportHint::Timeout ? std::errc::timed_out : std::errc::connection_aborted;
    throw std::system_error(std::make_error_code(errc), "Unable to write the " + std::to_string(status) +
                                                            " response (" + std::to_string(bytesWritten) + "/" +
                                                            std::to_string(head.size() + body.size()) + " bytes)");
  }
  _bodyBytes = body.size();
  _state = State::Flushed;
}

void ResponseContext::text(http::StatusCode status, std::string_view body) {
  respond(status, http::ContentTypeTextPlain, body);
}

void ResponseContext::html(http::StatusCode status, std::string_view body) {
  respond(status, http::ContentTypeTextHtml, body);
}

void ResponseContext::json(http::StatusCode status, std::string_view body) {
  respond(status, http::ContentTypeApplicationJson, body);
}

bool ResponseContext::file(http::StatusCode status, const std::string& path) {
  ensureUnstarted("file");
  File file(path);
  if (!file) {
    log::debug("Cannot serve '{}': not a readable regular file", path);
    return false;
  }
  const std::string content = file.loadAllContent();
  respond(status, file.detectedContentType(), content);
  return true;
}

void ResponseContext::redirect(std::string_view location) {
  ensureUnstarted("redirect");
  if (!http::IsValidHeaderValue(location)) {
    throw std::invalid_argument("Invalid redirect location");
  }
  setHeaderUnchecked(http::Location, location);
  respond(http::StatusCodeFound, {}, {});
  _transport.shutdown();
}

void ResponseContext::notFound() { respond(http::StatusCodeNotFound, http::ContentTypeTextHtml, http::NotFoundHtmlBody); }

void ResponseContext::write(std::string_view bytes) {
  // a Content-Type set by the handler is kept as is
  const bool hasContentType = !headerValueOrEmpty(http::ContentType).empty();
  respond(http::StatusCodeOK, hasContentType ? std::string_view{} : http::ContentTypeApplicationOctetStream, bytes);
}

void ResponseContext::send(http::StatusCode status, std::string_view body) { respond(status, {}, body); }

}  // namespace vermouth
