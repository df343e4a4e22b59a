#include "vermouth/url-decode.hpp"

#include <gtest/gtest.h>

#include <string>

#include "vermouth/char-hexadecimal-converter.hpp"

namespace vermouth {

TEST(HexDigit, FromHexDigit) {
  EXPECT_EQ(from_hex_digit('0'), 0);
  EXPECT_EQ(from_hex_digit('9'), 9);
  EXPECT_EQ(from_hex_digit('a'), 10);
  EXPECT_EQ(from_hex_digit('F'), 15);
  EXPECT_EQ(from_hex_digit('g'), -1);
  EXPECT_EQ(from_hex_digit('%'), -1);
}

TEST(UrlDecode, PlainString) { EXPECT_EQ(url::Decode("hello").value_or("<invalid>"), "hello"); }

TEST(UrlDecode, PercentEscapes) {
  EXPECT_EQ(url::Decode("a%20b").value_or("<invalid>"), "a b");
  EXPECT_EQ(url::Decode("%2e%2E").value_or("<invalid>"), "..");
  EXPECT_EQ(url::Decode("caf%C3%A9").value_or("<invalid>"), "caf\xC3\xA9");
}

TEST(UrlDecode, PlusHandling) {
  EXPECT_EQ(url::Decode("a+b").value_or("<invalid>"), "a+b");
  EXPECT_EQ(url::Decode("a+b", ' ').value_or("<invalid>"), "a b");
}

TEST(UrlDecode, InvalidEscapes) {
  EXPECT_FALSE(url::Decode("%"));
  EXPECT_FALSE(url::Decode("abc%2"));
  EXPECT_FALSE(url::Decode("%zz"));
}

TEST(UrlDecode, InPlaceCompacts) {
  std::string value = "a%2Fb+c";
  char* newEnd = url::DecodeInPlace(value.data(), value.data() + value.size(), ' ');
  ASSERT_NE(newEnd, nullptr);
  value.resize(static_cast<std::string::size_type>(newEnd - value.data()));
  EXPECT_EQ(value, "a/b c");
}

}  // namespace vermouth
