#include "vermouth/request-decoder.hpp"

#include <span>
#include <string_view>

#include "vermouth/http-constants.hpp"
#include "vermouth/http-request.hpp"
#include "vermouth/log.hpp"
#include "vermouth/request-builder.hpp"
#include "vermouth/string-trim.hpp"

namespace vermouth {

namespace {

std::string_view NextToken(std::string_view& line) {
  const auto first = line.find_first_not_of(' ');
  if (first == std::string_view::npos) {
    line = {};
    return {};
  }
  line.remove_prefix(first);
  const auto last = line.find(' ');
  const std::string_view token = line.substr(0, last);
  line.remove_prefix(last == std::string_view::npos ? line.size() : last);
  return token;
}

}  // namespace

RequestDecoder::Status RequestDecoder::Decode(std::span<const std::string_view> lines, std::string_view body,
                                              HttpRequest& out) {
  if (lines.empty()) {
    return Status::MalformedRequestLine;
  }

  std::string_view requestLine = lines.front();
  const std::string_view method = NextToken(requestLine);
  const std::string_view target = NextToken(requestLine);
  const std::string_view version = NextToken(requestLine);
  if (method.empty() || target.empty()) {
    log::debug("Malformed request line '{}'", lines.front());
    return Status::MalformedRequestLine;
  }

  RequestBuilder builder;
  builder.method(method).target(target).version(version.empty() ? http::HTTP10Sv : version);

  for (std::string_view line : lines.subspan(1)) {
    if (line.empty()) {
      break;
    }
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      log::debug("Ignoring header line without ':' '{}'", line);
      continue;
    }
    builder.header(TrimOws(line.substr(0, colonPos)), TrimOws(line.substr(colonPos + 1)));
  }

  builder.body(body);
  out = builder.build();
  return Status::Ok;
}

}  // namespace vermouth
