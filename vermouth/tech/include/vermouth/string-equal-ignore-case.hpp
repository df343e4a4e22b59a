#pragma once

#include <cstddef>
#include <string_view>

#include "vermouth/toupperlower.hpp"

namespace vermouth {

// ASCII-only comparison, sufficient for HTTP header field names.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace vermouth
