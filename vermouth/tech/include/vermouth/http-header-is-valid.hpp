#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>

namespace vermouth::http {

// token character of a field name:
//   "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
constexpr bool IsTokenChar(char ch) noexcept {
  constexpr std::uint64_t kTokenBits[2] = {
      (1ULL << '!') | (1ULL << '#') | (1ULL << '$') | (1ULL << '%') | (1ULL << '&') | (1ULL << '\'') | (1ULL << '*') |
          (1ULL << '+') | (1ULL << '-') | (1ULL << '.') | (0x3FFULL << '0'),
      (0x3FFFFFFULL << ('A' - 64)) | (0x3FFFFFFULL << ('a' - 64)) | (1ULL << ('^' - 64)) | (1ULL << ('_' - 64)) |
          (1ULL << ('`' - 64)) | (1ULL << ('|' - 64)) | (1ULL << ('~' - 64))};
  const auto uc = static_cast<unsigned char>(ch);
  return uc < 128U && ((kTokenBits[uc >> 6] >> (uc & 63U)) & 1U) != 0U;
}

// A header name is a non-empty token.
constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, [](char ch) { return IsTokenChar(ch); });
}

// A header value may contain visible ASCII, space and horizontal tab. CR, LF and other controls are refused,
// so that a value can never end the header line it is written on.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](char ch) {
    const auto uc = static_cast<unsigned char>(ch);
    return uc == '\t' || (uc >= 0x20U && uc < 0x7FU);
  });
}

}  // namespace vermouth::http
