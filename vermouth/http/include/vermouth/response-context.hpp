#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vermouth/http-status-code.hpp"
#include "vermouth/transport.hpp"

#ifdef VERMOUTH_ENABLE_GLAZE
#include "vermouth/json-serializer.hpp"
#endif

namespace vermouth {

// Per-request response writer bound to the connection transport.
// It accumulates headers, then frames exactly one response on the wire:
//   HTTP/1.1 <code> <reason>\r\n
//   Name: Value\r\n (each header)
//   \r\n
//   <body>
// Each response method sets Content-Type and Content-Length itself.
// Once the status line has been emitted, any further setHeader() or response method throws std::logic_error.
// Write failures throw std::system_error (the connection should then be dropped).
class ResponseContext {
 public:
  enum class State : std::uint8_t {
    Unstarted,  // nothing written yet, headers can still be set
    HeaderSent, // status line emitted, header set frozen
    Flushed     // headers and body fully written
  };

  explicit ResponseContext(ITransport& transport) noexcept : _transport(transport) {}

  ResponseContext(const ResponseContext&) = delete;
  ResponseContext(ResponseContext&&) = delete;
  ResponseContext& operator=(const ResponseContext&) = delete;
  ResponseContext& operator=(ResponseContext&&) = delete;

  ~ResponseContext() = default;

  // Sets (or replaces, case-insensitively) a response header.
  // Content-Length is always computed from the body: setting it here has no effect on the framing.
  // Throws std::invalid_argument if 'name' is not a token or 'value' contains CR, LF or another control character.
  ResponseContext& setHeader(std::string_view name, std::string_view value);

  // Returns the value of a header set with setHeader, or an empty string_view.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept;

  // Plain text body, 'text/plain'.
  void text(http::StatusCode status, std::string_view body);

  // HTML body, 'text/html'.
  void html(http::StatusCode status, std::string_view body);

  // Already serialized JSON body, 'application/json'.
  void json(http::StatusCode status, std::string_view body);

#ifdef VERMOUTH_ENABLE_GLAZE
  // Serializes 'value' to JSON and sends it. Returns false, without writing anything, if encoding fails.
  template <class T>
  [[nodiscard]] bool json(http::StatusCode status, const T& value) {
    auto serialized = SerializeToJson(value);
    if (!serialized) {
      return false;
    }
    json(status, std::string_view(*serialized));
    return true;
  }
#endif

  // Sends the content of the file at 'path', with a Content-Type detected from its extension.
  // Returns false, without writing anything, if the file cannot be opened or is not a regular file.
  [[nodiscard]] bool file(http::StatusCode status, const std::string& path);

  // 302 with a Location header and an empty body, then terminates the connection.
  // Throws std::invalid_argument, writing nothing, if 'location' contains CR, LF or another control character.
  void redirect(std::string_view location);

  // 404 with the fixed HTML body '<h1>Error 404 Not Found</h1>'.
  void notFound();

  // Raw bytes. Frames a 200 response, with 'application/octet-stream' unless a Content-Type was set.
  void write(std::string_view bytes);

  // Generic form: status + body, keeping the Content-Type set by setHeader (none if unset).
  void send(http::StatusCode status, std::string_view body);

  [[nodiscard]] State state() const noexcept { return _state; }

  // Returns true once the status line has been emitted.
  [[nodiscard]] bool headersSent() const noexcept { return _state != State::Unstarted; }

  // Status code of the response, 0 if no response was started.
  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  // Number of body bytes written.
  [[nodiscard]] std::size_t bodyBytes() const noexcept { return _bodyBytes; }

 private:
  void respond(http::StatusCode status, std::string_view contentType, std::string_view body);

  void ensureUnstarted(std::string_view operation) const;

  void setHeaderUnchecked(std::string_view name, std::string_view value);

  ITransport& _transport;
  std::vector<std::pair<std::string, std::string>> _headers;
  std::size_t _bodyBytes{0};
  http::StatusCode _status{0};
  State _state{State::Unstarted};
};

std::string_view ResponseStateToString(ResponseContext::State state) noexcept;

}  // namespace vermouth
