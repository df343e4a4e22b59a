#include "vermouth/static-file-handler.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "vermouth/http-constants.hpp"
#include "vermouth/http-request.hpp"
#include "vermouth/path-params.hpp"
#include "vermouth/request-builder.hpp"
#include "vermouth/response-context.hpp"
#include "vermouth/string-transport.hpp"
#include "vermouth/temp-file.hpp"

namespace vermouth {

class StaticFileHandlerTest : public ::testing::Test {
 protected:
  // Runs the handler for 'relativePath' captured as the 'filepath' parameter, returns the raw response.
  std::string serve(std::string_view relativePath) {
    HttpRequest request = RequestBuilder{}.method("GET").target("/static/x").build();
    PathParams params;
    params.set(StaticFileHandler::kFilePathParam, relativePath);
    RequestBuilder::AttachPathParams(request, std::move(params));

    test::StringTransport transport;
    ResponseContext response(transport);
    handler(request, response);
    return transport.output();
  }

  static bool IsNotFound(const std::string& raw) { return raw.starts_with("HTTP/1.1 404 Not Found\r\n"); }

  test::ScopedTempDir root;
  test::ScopedTempFile index{root, "index.html", "<h1>home</h1>"};
  test::ScopedTempFile css{root, "css/site.css", "body{}"};
  test::ScopedTempFile spaced{root, "my file+1.txt", "spaced"};
  StaticFileHandler handler{root.dirPath()};
};

TEST_F(StaticFileHandlerTest, ServesFileWithMimeType) {
  const std::string raw = serve("css/site.css");
  EXPECT_EQ(raw, "HTTP/1.1 200 OK\r\nContent-Type: text/css\r\nContent-Length: 6\r\n\r\nbody{}");
}

TEST_F(StaticFileHandlerTest, DirectoryServesIndex) {
  EXPECT_TRUE(serve("").ends_with("\r\n\r\n<h1>home</h1>"));
  EXPECT_NE(serve("").find("Content-Type: text/html\r\n"), std::string::npos);
  EXPECT_TRUE(serve("./").ends_with("<h1>home</h1>"));
}

TEST_F(StaticFileHandlerTest, DirectoryWithoutIndexIsNotFound) { EXPECT_TRUE(IsNotFound(serve("css"))); }

TEST_F(StaticFileHandlerTest, MissingFileIsNotFound) {
  const std::string raw = serve("nope.txt");
  ASSERT_TRUE(IsNotFound(raw));
  EXPECT_TRUE(raw.ends_with(http::NotFoundHtmlBody));
}

TEST_F(StaticFileHandlerTest, PercentDecodingKeepsPlus) {
  EXPECT_TRUE(serve("my%20file+1.txt").ends_with("spaced"));
  EXPECT_TRUE(IsNotFound(serve("my%20file%201.txt")));
}

TEST_F(StaticFileHandlerTest, TraversalIsRejected) {
  test::ScopedTempDir outside;
  test::ScopedTempFile secret(outside, "secret.txt", "secret");
  const std::string relativeToSecret = "../" + outside.dirPath().filename().string() + "/secret.txt";

  EXPECT_TRUE(IsNotFound(serve(relativeToSecret)));
  EXPECT_TRUE(IsNotFound(serve("css/../../etc/passwd")));
  EXPECT_TRUE(IsNotFound(serve("%2e%2e/%2e%2e/etc/passwd")));
  EXPECT_TRUE(IsNotFound(serve("css/%2E%2E/index.html")));
  EXPECT_TRUE(IsNotFound(serve("bad%zzescape")));
  EXPECT_TRUE(IsNotFound(serve("index.html%00.txt")));
}

TEST_F(StaticFileHandlerTest, SymlinkOutsideRootIsRejected) {
  test::ScopedTempDir outside;
  test::ScopedTempFile secret(outside, "secret.txt", "secret");
  std::filesystem::create_symlink(secret.filePath(), root.dirPath() / "link.txt");

  EXPECT_TRUE(IsNotFound(serve("link.txt")));
}

TEST_F(StaticFileHandlerTest, ResolveTarget) {
  std::filesystem::path resolved;
  ASSERT_TRUE(handler.resolveTarget("css//site.css", resolved));
  EXPECT_EQ(resolved, handler.root() / "css" / "site.css");

  ASSERT_TRUE(handler.resolveTarget("", resolved));
  EXPECT_EQ(resolved.filename().string(), StaticFileHandler::kDefaultIndex);

  EXPECT_FALSE(handler.resolveTarget("..", resolved));
}

TEST_F(StaticFileHandlerTest, FallsBackToRequestPath) {
  HttpRequest request = RequestBuilder{}.method("GET").target("/css/site.css").build();
  test::StringTransport transport;
  ResponseContext response(transport);
  handler(request, response);
  EXPECT_TRUE(transport.output().ends_with("body{}"));
}

TEST(StaticFileHandler, RootMustBeAnExistingDirectory) {
  test::ScopedTempDir dir;
  test::ScopedTempFile file(dir, "plain.txt", "x");
  EXPECT_THROW(StaticFileHandler(dir.dirPath() / "missing"), std::invalid_argument);
  EXPECT_THROW(StaticFileHandler{file.filePath()}, std::invalid_argument);
}

}  // namespace vermouth
