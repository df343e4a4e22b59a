#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "vermouth/http-request.hpp"

namespace vermouth {

// Turns the line records of a request head, plus its body bytes, into a HttpRequest.
class RequestDecoder {
 public:
  enum class Status : std::uint8_t { Ok, MalformedRequestLine };

  // Line 0 is the request line 'METHOD SP TARGET [SP VERSION]'. Fewer than two tokens is malformed.
  // Following lines are 'Name: Value' headers until the first empty line. Lines without a colon are ignored.
  // 'out' is only assigned on success.
  [[nodiscard]] static Status Decode(std::span<const std::string_view> lines, std::string_view body, HttpRequest& out);
};

}  // namespace vermouth
