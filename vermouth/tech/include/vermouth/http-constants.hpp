#pragma once

#include <string_view>

#include "vermouth/http-status-code.hpp"

namespace vermouth::http {

// Header field names are stored in their conventional canonical form for emission.
// Lookups on request headers are case-insensitive.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view DELETE = "DELETE";
inline constexpr std::string_view OPTIONS = "OPTIONS";
inline constexpr std::string_view PATCH = "PATCH";

// Header field names
inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view SecChUaPlatform = "Sec-CH-UA-Platform";
inline constexpr std::string_view UserAgent = "User-Agent";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Fixed body of the not-found response.
inline constexpr std::string_view NotFoundHtmlBody = "<h1>Error 404 Not Found</h1>";

// Return the IANA reason phrase for the given status code, or an empty string_view if unknown.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeContinue:
      return "Continue";
    case StatusCodeSwitchingProtocols:
      return "Switching Protocols";
    case StatusCodeProcessing:
      return "Processing";
    case StatusCodeEarlyHints:
      return "Early Hints";
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNonAuthoritativeInformation:
      return "Non-Authoritative Information";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodeResetContent:
      return "Reset Content";
    case StatusCodePartialContent:
      return "Partial Content";
    case StatusCodeMultiStatus:
      return "Multi-Status";
    case StatusCodeAlreadyReported:
      return "Already Reported";
    case StatusCodeIMUsed:
      return "IM Used";
    case StatusCodeMultipleChoices:
      return "Multiple Choices";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeSeeOther:
      return "See Other";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeUseProxy:
      return "Use Proxy";
    case StatusCodeTemporaryRedirect:
      return "Temporary Redirect";
    case StatusCodePermanentRedirect:
      return "Permanent Redirect";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodePaymentRequired:
      return "Payment Required";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeNotAcceptable:
      return "Not Acceptable";
    case StatusCodeProxyAuthenticationRequired:
      return "Proxy Authentication Required";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeConflict:
      return "Conflict";
    case StatusCodeGone:
      return "Gone";
    case StatusCodeLengthRequired:
      return "Length Required";
    case StatusCodePreconditionFailed:
      return "Precondition Failed";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeURITooLong:
      return "URI Too Long";
    case StatusCodeUnsupportedMediaType:
      return "Unsupported Media Type";
    case StatusCodeRangeNotSatisfiable:
      return "Range Not Satisfiable";
    case StatusCodeExpectationFailed:
      return "Expectation Failed";
    case StatusCodeImATeapot:
      return "I'm a teapot";
    case StatusCodeMisdirectedRequest:
      return "Misdirected Request";
    case StatusCodeUnprocessableEntity:
      return "Unprocessable Entity";
    case StatusCodeLocked:
      return "Locked";
    case StatusCodeFailedDependency:
      return "Failed Dependency";
    case StatusCodeTooEarly:
      return "Too Early";
    case StatusCodeUpgradeRequired:
      return "Upgrade Required";
    case StatusCodePreconditionRequired:
      return "Precondition Required";
    case StatusCodeTooManyRequests:
      return "Too Many Requests";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeUnavailableForLegalReasons:
      return "Unavailable For Legal Reasons";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeBadGateway:
      return "Bad Gateway";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeGatewayTimeout:
      return "Gateway Timeout";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    case StatusCodeVariantAlsoNegotiates:
      return "Variant Also Negotiates";
    case StatusCodeInsufficientStorage:
      return "Insufficient Storage";
    case StatusCodeLoopDetected:
      return "Loop Detected";
    case StatusCodeNotExtended:
      return "Not Extended";
    case StatusCodeNetworkAuthenticationRequired:
      return "Network Authentication Required";
    default:
      return {};
  }
}

}  // namespace vermouth::http
