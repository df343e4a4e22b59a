#include "vermouth/connection-dispatcher.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <exception>
#include <string_view>
#include <system_error>
#include <utility>

#include "vermouth/base-fd.hpp"
#include "vermouth/head-reader.hpp"
#include "vermouth/http-constants.hpp"
#include "vermouth/http-request.hpp"
#include "vermouth/http-status-code.hpp"
#include "vermouth/log.hpp"
#include "vermouth/middleware.hpp"
#include "vermouth/path-params.hpp"
#include "vermouth/request-builder.hpp"
#include "vermouth/request-decoder.hpp"
#include "vermouth/response-context.hpp"
#include "vermouth/socket-ops.hpp"
#include "vermouth/transport.hpp"

namespace vermouth {

namespace {

constexpr std::size_t kMaxDrainedBytes = 1UL << 16;

void SendError(ResponseContext& response, http::StatusCode status) {
  response.text(status, http::ReasonPhraseFor(status));
}

}  // namespace

void ConnectionDispatcher::dispatch(ITransport& transport) const {
  ResponseContext response(transport);

  HeadReader reader(transport, _config);
  const HeadReader::Status readStatus = reader.read();
  switch (readStatus) {
    case HeadReader::Status::Ok:
      break;
    case HeadReader::Status::Closed:
      log::debug("Connection closed by peer before sending a request");
      return;
    case HeadReader::Status::TooLarge:
      SendError(response, http::StatusCodeRequestHeaderFieldsTooLarge);
      return;
    case HeadReader::Status::BodyTooLarge:
      SendError(response, http::StatusCodePayloadTooLarge);
      return;
    case HeadReader::Status::BadLength:
      SendError(response, http::StatusCodeBadRequest);
      return;
    case HeadReader::Status::Timeout:
      SendError(response, http::StatusCodeRequestTimeout);
      return;
    case HeadReader::Status::Error:
      [[fallthrough]];
    default:
      log::warn("Unable to read request: {}", HeadReaderStatusToString(readStatus));
      return;
  }

  HttpRequest request;
  if (RequestDecoder::Decode(reader.lines(), reader.body(), request) != RequestDecoder::Status::Ok) {
    log::warn("Malformed request line, answering {}", _config.malformedRequestStatus);
    SendError(response, _config.malformedRequestStatus);
    return;
  }

  try {
    PathParams pathParams;
    const Handler handler = _router.resolve(request.method(), request.path(), pathParams);
    if (!handler) {
      log::debug("No route for {} {}", request.method(), request.path());
      response.notFound();
      return;
    }
    RequestBuilder::AttachPathParams(request, std::move(pathParams));

    handler(request, response);
  } catch (const std::exception& ex) {
    log::error("Exception while handling {} {}: {}", request.method(), request.path(), ex.what());
    if (!response.headersSent()) {
      SendError(response, http::StatusCodeInternalServerError);
    }
    return;
  } catch (...) {
    log::error("Unknown exception while handling {} {}", request.method(), request.path());
    if (!response.headersSent()) {
      SendError(response, http::StatusCodeInternalServerError);
    }
    return;
  }

  if (!response.headersSent()) {
    log::warn("Handler for {} {} returned without responding, closing connection", request.method(), request.path());
  }
}

void ConnectionDispatcher::serve(ITransport& transport) const noexcept {
  try {
    dispatch(transport);
  } catch (const std::system_error& ex) {
    // the connection is unusable: nothing more can be sent
    log::error("Connection aborted: {}", ex.what());
  } catch (const std::exception& ex) {
    log::error("Connection dropped: {}", ex.what());
  }
}

void ConnectionDispatcher::serve(BaseFd connection) const noexcept {
  const int fd = connection.fd();
  if (_config.tcpNoDelay && !SetTcpNoDelay(fd)) {
    log::warn("Unable to set TCP_NODELAY on fd # {}: {}", fd, std::strerror(errno));
  }
  if (!SetRecvTimeout(fd, _config.readTimeout)) {
    log::warn("Unable to set read timeout on fd # {}: {}", fd, std::strerror(errno));
  }
  if (!SetSendTimeout(fd, _config.writeTimeout)) {
    log::warn("Unable to set write timeout on fd # {}: {}", fd, std::strerror(errno));
  }

  PlainTransport transport(fd);
  serve(transport);

  // Half-close and drain unread bytes: closing with pending input would reset the connection
  // and could discard the response before the peer reads it.
  if (ShutdownWrite(fd)) {
    std::array<char, 1024> buf;
    for (std::size_t drained = 0; drained < kMaxDrainedBytes;) {
      const auto [bytesRead, want] = transport.read(buf.data(), buf.size());
      if (bytesRead == 0) {
        break;
      }
      drained += bytesRead;
    }
  }
  // connection is closed by BaseFd destructor
}

}  // namespace vermouth
