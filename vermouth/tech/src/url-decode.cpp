#include "vermouth/url-decode.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "vermouth/char-hexadecimal-converter.hpp"

namespace vermouth::url {

char* DecodeInPlace(char* first, char* last, char plusAs) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch == '+') {
      *out++ = plusAs;
      continue;
    }
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      return nullptr;
    }
    const int hi = from_hex_digit(first[1]);
    const int lo = from_hex_digit(first[2]);
    if (hi < 0 || lo < 0) {
      return nullptr;
    }
    *out++ = static_cast<char>((hi << 4) | lo);
    first += 2;
  }
  return out;
}

std::optional<std::string> Decode(std::string_view encoded, char plusAs) {
  std::string ret(encoded);
  char* newEnd = DecodeInPlace(ret.data(), ret.data() + ret.size(), plusAs);
  if (newEnd == nullptr) {
    return std::nullopt;
  }
  ret.resize(static_cast<std::string::size_type>(newEnd - ret.data()));
  return ret;
}

}  // namespace vermouth::url
