#include "vermouth/http-request.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vermouth/form-values.hpp"
#include "vermouth/path-params.hpp"
#include "vermouth/request-builder.hpp"

#ifdef VERMOUTH_ENABLE_GLAZE
namespace {

struct Order {
  std::string item;
  int quantity{0};
};

}  // namespace

template <>
struct glz::meta<Order> {
  using T = Order;
  static constexpr auto value = glz::object("item", &T::item, "quantity", &T::quantity);
};
#endif

namespace vermouth {

namespace {

HttpRequest MakeRequest(std::string_view target, std::string_view body = {}) {
  return RequestBuilder{}.method("POST").target(target).version("HTTP/1.1").body(body).build();
}

}  // namespace

TEST(HttpRequest, ReadBodyConsumesOnce) {
  HttpRequest request = MakeRequest("/echo", "hello");
  EXPECT_TRUE(request.hasBody());

  std::string body;
  EXPECT_EQ(request.readBody(body), BodyDecodeStatus::Ok);
  EXPECT_EQ(body, "hello");
  EXPECT_FALSE(request.hasBody());

  std::string again;
  EXPECT_EQ(request.readBody(again), BodyDecodeStatus::AlreadyConsumed);
  EXPECT_TRUE(again.empty());
}

TEST(HttpRequest, NoBodyStillConsumes) {
  HttpRequest request = MakeRequest("/empty");
  EXPECT_FALSE(request.hasBody());

  std::string body;
  EXPECT_EQ(request.readBody(body), BodyDecodeStatus::NoBody);
  EXPECT_EQ(request.readBody(body), BodyDecodeStatus::AlreadyConsumed);
}

TEST(HttpRequest, DecodeForm) {
  HttpRequest request = MakeRequest("/form", "name=Ada+Lovelace&lang=c%2B%2B&lang=rust");
  FormValues form;
  ASSERT_EQ(request.decodeForm(form), BodyDecodeStatus::Ok);
  EXPECT_EQ(form.getOrEmpty("name"), "Ada Lovelace");
  EXPECT_EQ(form.getAll("lang"), (std::vector<std::string_view>{"c++", "rust"}));

  FormValues other;
  EXPECT_EQ(request.decodeForm(other), BodyDecodeStatus::AlreadyConsumed);
  EXPECT_TRUE(other.empty());
}

TEST(HttpRequest, DecodeFormMalformed) {
  HttpRequest request = MakeRequest("/form", "bad=%zz");
  FormValues form;
  EXPECT_EQ(request.decodeForm(form), BodyDecodeStatus::Malformed);
  EXPECT_TRUE(form.empty());
  // a failed decode still consumes the body
  std::string body;
  EXPECT_EQ(request.readBody(body), BodyDecodeStatus::AlreadyConsumed);
}

TEST(HttpRequest, DecodeFormAfterReadBody) {
  HttpRequest request = MakeRequest("/form", "a=1");
  std::string body;
  ASSERT_EQ(request.readBody(body), BodyDecodeStatus::Ok);
  FormValues form;
  EXPECT_EQ(request.decodeForm(form), BodyDecodeStatus::AlreadyConsumed);
}

TEST(HttpRequest, QueryParams) {
  HttpRequest request = MakeRequest("/search?q=a%20b&flag");
  EXPECT_EQ(request.path(), "/search");
  auto params = request.queryParams();
  ASSERT_TRUE(params.has_value());
  EXPECT_EQ(params->getOrEmpty("q"), "a b");
  EXPECT_TRUE(params->contains("flag"));
  EXPECT_EQ(params->getOrEmpty("flag"), "");

  EXPECT_FALSE(MakeRequest("/search?q=%G1").queryParams().has_value());
}

TEST(HttpRequest, OnlyFirstQuestionMarkSplits) {
  HttpRequest request = MakeRequest("/p?a=1?b");
  EXPECT_EQ(request.path(), "/p");
  EXPECT_EQ(request.query(), "a=1?b");
}

TEST(HttpRequest, PlatformStripsQuotes) {
  HttpRequest quoted = RequestBuilder{}.method("GET").target("/").header("Sec-CH-UA-Platform", "\"Linux\"").build();
  EXPECT_EQ(quoted.platform(), "Linux");

  HttpRequest bare = RequestBuilder{}.method("GET").target("/").header("sec-ch-ua-platform", "macOS").build();
  EXPECT_EQ(bare.platform(), "macOS");

  HttpRequest lonelyQuote = RequestBuilder{}.method("GET").target("/").header("Sec-CH-UA-Platform", "\"").build();
  EXPECT_EQ(lonelyQuote.platform(), "\"");
}

TEST(HttpRequest, HeaderPresentWithEmptyValue) {
  HttpRequest request = RequestBuilder{}.method("GET").target("/").header("X-Empty", "").build();
  auto value = request.headerValue("x-empty");
  ASSERT_TRUE(value.has_value());
  EXPECT_TRUE(value->empty());
  EXPECT_FALSE(request.headerValue("X-Missing").has_value());
}

TEST(HttpRequest, BuilderReplacesHeaderKeepingPosition) {
  HttpRequest request =
      RequestBuilder{}.method("GET").target("/").header("A", "1").header("B", "2").header("a", "3").build();
  ASSERT_EQ(request.headers().size(), 2U);
  EXPECT_EQ(request.headers()[0].first, "A");
  EXPECT_EQ(request.headers()[0].second, "3");
  EXPECT_EQ(request.headers()[1].second, "2");
}

TEST(HttpRequest, PathParams) {
  HttpRequest request = MakeRequest("/users/42");
  EXPECT_TRUE(request.pathParam("id").empty());

  PathParams params;
  params.set("id", "42");
  RequestBuilder::AttachPathParams(request, std::move(params));
  EXPECT_EQ(request.pathParam("id"), "42");
  EXPECT_TRUE(request.pathParam("other").empty());
  EXPECT_EQ(request.pathParams().size(), 1U);
}

#ifdef VERMOUTH_ENABLE_GLAZE
TEST(HttpRequest, DecodeJson) {
  HttpRequest request = MakeRequest("/orders", R"({"item":"vermouth","quantity":2})");
  Order order;
  ASSERT_EQ(request.decodeJson(order), BodyDecodeStatus::Ok);
  EXPECT_EQ(order.item, "vermouth");
  EXPECT_EQ(order.quantity, 2);
  EXPECT_EQ(request.decodeJson(order), BodyDecodeStatus::AlreadyConsumed);
}

TEST(HttpRequest, DecodeJsonMalformed) {
  HttpRequest request = MakeRequest("/orders", R"({"item":)");
  Order order;
  EXPECT_EQ(request.decodeJson(order), BodyDecodeStatus::Malformed);

  HttpRequest empty = MakeRequest("/orders");
  EXPECT_EQ(empty.decodeJson(order), BodyDecodeStatus::NoBody);
}
#endif

TEST(HttpRequest, BodyDecodeStatusToString) {
  EXPECT_EQ(BodyDecodeStatusToString(BodyDecodeStatus::Ok), "Ok");
  EXPECT_EQ(BodyDecodeStatusToString(BodyDecodeStatus::NoBody), "NoBody");
  EXPECT_EQ(BodyDecodeStatusToString(BodyDecodeStatus::AlreadyConsumed), "AlreadyConsumed");
  EXPECT_EQ(BodyDecodeStatusToString(BodyDecodeStatus::Malformed), "Malformed");
}

}  // namespace vermouth
