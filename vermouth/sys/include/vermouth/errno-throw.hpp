#pragma once

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

namespace vermouth {

// Capture errno immediately and throw std::system_error with the given context message.
// Usage: throw_errno("bind failed for port ", std::to_string(port));
template <typename... Parts>
[[noreturn]] void throw_errno(std::string_view first, const Parts&... parts) {
  const int savedErr = errno;
  std::string msg(first);
  (msg.append(parts), ...);
  throw std::system_error(std::error_code(savedErr, std::generic_category()), msg);
}

}  // namespace vermouth
