#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vermouth/http-server-config.hpp"
#include "vermouth/transport.hpp"

namespace vermouth {

// Pulls the bytes of one request off a connection and splits its head into CRLF line records.
// Reads chunks of readChunkBytes until the blank line terminating the head is seen, then completes
// the body up to the announced Content-Length, if any.
class HeadReader {
 public:
  enum class Status : std::uint8_t {
    Ok,            // lines() and body() are available
    Closed,        // peer closed the connection before sending anything
    TooLarge,      // request head exceeds maxHeaderBytes
    BodyTooLarge,  // announced Content-Length exceeds maxBodyBytes
    BadLength,     // Content-Length value is not a decimal number
    Timeout,       // read deadline expired
    Error          // transport failure
  };

  HeadReader(ITransport& transport, const HttpServerConfig& config) noexcept
      : _transport(transport), _config(config) {}

  // Reads one request. Views returned by lines() and body() stay valid until the next call.
  [[nodiscard]] Status read();

  // Head lines, request line first. The blank line terminating the head is not included.
  [[nodiscard]] std::span<const std::string_view> lines() const noexcept { return _lines; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Total number of bytes received for the last request.
  [[nodiscard]] std::size_t bytesRead() const noexcept { return _buffer.size(); }

 private:
  // Appends up to 'len' bytes to the buffer. Returns the number of bytes read (0 on close, timeout or error).
  std::size_t readChunk(std::size_t len, TransportHint& hint);

  ITransport& _transport;
  const HttpServerConfig& _config;
  std::string _buffer;
  std::vector<std::string_view> _lines;
  std::string_view _body;
};

std::string_view HeadReaderStatusToString(HeadReader::Status status) noexcept;

}  // namespace vermouth
