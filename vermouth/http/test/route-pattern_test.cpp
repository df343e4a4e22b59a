#include "vermouth/route-pattern.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "vermouth/path-params.hpp"

namespace vermouth {

TEST(RoutePattern, Segments) {
  RoutePattern pattern("/users/:id/files/:rest*");
  EXPECT_EQ(pattern.str(), "/users/:id/files/:rest*");
  ASSERT_EQ(pattern.segments().size(), 4U);
  EXPECT_EQ(pattern.segments()[0], (RoutePattern::Segment{RoutePattern::SegmentKind::Literal, "users"}));
  EXPECT_EQ(pattern.segments()[1], (RoutePattern::Segment{RoutePattern::SegmentKind::Param, "id"}));
  EXPECT_EQ(pattern.segments()[3], (RoutePattern::Segment{RoutePattern::SegmentKind::Wildcard, "rest"}));
}

TEST(RoutePattern, InvalidPatterns) {
  EXPECT_THROW(RoutePattern(""), std::invalid_argument);
  EXPECT_THROW(RoutePattern("users"), std::invalid_argument);
  EXPECT_THROW(RoutePattern("/users/:"), std::invalid_argument);
  EXPECT_THROW(RoutePattern("/files/:*"), std::invalid_argument);
}

TEST(RoutePattern, Root) {
  RoutePattern pattern("/");
  PathParams params;
  EXPECT_TRUE(pattern.match("/", params));
  EXPECT_TRUE(params.empty());
  EXPECT_FALSE(pattern.match("/a", params));
  EXPECT_FALSE(pattern.match("", params));
}

TEST(RoutePattern, LiteralIsCaseSensitive) {
  RoutePattern pattern("/Health");
  PathParams params;
  EXPECT_TRUE(pattern.match("/Health", params));
  EXPECT_FALSE(pattern.match("/health", params));
}

TEST(RoutePattern, ParamCapture) {
  RoutePattern pattern("/users/:id/posts/:postId");
  PathParams params;
  ASSERT_TRUE(pattern.match("/users/42/posts/abc", params));

  PathParams expected;
  expected.set("id", "42");
  expected.set("postId", "abc");
  EXPECT_EQ(params, expected);
}

TEST(RoutePattern, ParamCapturesEmptySegment) {
  RoutePattern pattern("/users/:id");
  PathParams params;
  ASSERT_TRUE(pattern.match("/users/", params));
  EXPECT_EQ(params.find("id"), "");
}

TEST(RoutePattern, SegmentCountMismatch) {
  RoutePattern pattern("/users/:id");
  PathParams params;
  EXPECT_FALSE(pattern.match("/users", params));
  EXPECT_FALSE(pattern.match("/users/42/extra", params));
}

TEST(RoutePattern, TrailingSlashIsSignificant) {
  PathParams params;
  EXPECT_FALSE(RoutePattern("/user").match("/user/", params));
  EXPECT_FALSE(RoutePattern("/user/").match("/user", params));
  EXPECT_TRUE(RoutePattern("/user/").match("/user/", params));
}

TEST(RoutePattern, WildcardCapturesRemainder) {
  RoutePattern pattern("/static/:filepath*");
  PathParams params;
  ASSERT_TRUE(pattern.match("/static/css/site/main.css", params));
  EXPECT_EQ(params.find("filepath"), "css/site/main.css");

  ASSERT_TRUE(pattern.match("/static/", params));
  EXPECT_EQ(params.find("filepath"), "");

  ASSERT_TRUE(pattern.match("/static", params));
  EXPECT_EQ(params.find("filepath"), "");
  EXPECT_EQ(params.size(), 1U);

  EXPECT_FALSE(pattern.match("/other/a", params));
}

TEST(RoutePattern, NonTerminalWildcardEndsMatching) {
  RoutePattern pattern("/a/:rest*/ignored");
  PathParams params;
  ASSERT_TRUE(pattern.match("/a/b/c", params));
  EXPECT_EQ(params.find("rest"), "b/c");
}

TEST(RoutePattern, MatchClearsPreviousCaptures) {
  PathParams params;
  params.set("stale", "value");
  ASSERT_TRUE(RoutePattern("/users/:id").match("/users/7", params));
  EXPECT_EQ(params.size(), 1U);
  EXPECT_FALSE(params.find("stale").has_value());
}

TEST(RoutePattern, CapturedValuesAreNotDecoded) {
  PathParams params;
  ASSERT_TRUE(RoutePattern("/files/:name").match("/files/a%20b", params));
  EXPECT_EQ(params.find("name"), "a%20b");
}

}  // namespace vermouth
