#include "vermouth/head-reader.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "vermouth/http-server-config.hpp"
#include "vermouth/string-transport.hpp"
#include "vermouth/transport.hpp"

namespace vermouth {

using test::StringTransport;

class HeadReaderTest : public ::testing::Test {
 protected:
  HttpServerConfig config;
};

TEST_F(HeadReaderTest, SplitsHeadIntoLines) {
  StringTransport transport("GET /a HTTP/1.1\r\nHost: x\r\nAccept: */*\r\n\r\n");
  HeadReader reader(transport, config);
  ASSERT_EQ(reader.read(), HeadReader::Status::Ok);
  ASSERT_EQ(reader.lines().size(), 3U);
  EXPECT_EQ(reader.lines()[0], "GET /a HTTP/1.1");
  EXPECT_EQ(reader.lines()[1], "Host: x");
  EXPECT_EQ(reader.lines()[2], "Accept: */*");
  EXPECT_TRUE(reader.body().empty());
}

TEST_F(HeadReaderTest, ReadsIncrementallyAcrossChunks) {
  config.withReadChunkBytes(4);
  // terminator split between reads
  StringTransport transport("GET /incremental HTTP/1.1\r\nHost: localhost\r\n\r\n", 3);
  HeadReader reader(transport, config);
  ASSERT_EQ(reader.read(), HeadReader::Status::Ok);
  ASSERT_EQ(reader.lines().size(), 2U);
  EXPECT_EQ(reader.lines()[1], "Host: localhost");
  EXPECT_GT(transport.nbReadCalls(), 10U);
}

TEST_F(HeadReaderTest, HeadLongerThanOneChunkIsNotTruncated) {
  std::string head = "GET / HTTP/1.1\r\nX-Long: ";
  head.append(3000, 'a');
  head.append("\r\n\r\n");
  StringTransport transport(head);
  HeadReader reader(transport, config);
  ASSERT_EQ(reader.read(), HeadReader::Status::Ok);
  ASSERT_EQ(reader.lines().size(), 2U);
  EXPECT_EQ(reader.lines()[1].size(), 8U + 3000U);
}

TEST_F(HeadReaderTest, ClosedBeforeAnyByte) {
  StringTransport transport("");
  HeadReader reader(transport, config);
  EXPECT_EQ(reader.read(), HeadReader::Status::Closed);
}

TEST_F(HeadReaderTest, UnterminatedHeadIsDecodedAsIs) {
  StringTransport transport("GET /partial HTTP/1.1\r\nHost: x");
  HeadReader reader(transport, config);
  ASSERT_EQ(reader.read(), HeadReader::Status::Ok);
  ASSERT_EQ(reader.lines().size(), 2U);
  EXPECT_EQ(reader.lines()[0], "GET /partial HTTP/1.1");
  EXPECT_EQ(reader.lines()[1], "Host: x");
}

TEST_F(HeadReaderTest, TooLargeHead) {
  config.withMaxHeaderBytes(128);
  std::string head = "GET / HTTP/1.1\r\nX-Big: ";
  head.append(200, 'b');
  head.append("\r\n\r\n");
  StringTransport transport(head);
  HeadReader reader(transport, config);
  EXPECT_EQ(reader.read(), HeadReader::Status::TooLarge);
}

TEST_F(HeadReaderTest, TooLargeHeadWithoutTerminator) {
  config.withMaxHeaderBytes(128);
  StringTransport transport(std::string(1000, 'z'));
  HeadReader reader(transport, config);
  EXPECT_EQ(reader.read(), HeadReader::Status::TooLarge);
}

TEST_F(HeadReaderTest, TimeoutWhileReadingHead) {
  StringTransport transport("GET / HTTP/1.1\r\n");
  transport.setEndOfInputHint(TransportHint::Timeout);
  HeadReader reader(transport, config);
  EXPECT_EQ(reader.read(), HeadReader::Status::Timeout);
}

TEST_F(HeadReaderTest, TransportError) {
  StringTransport transport("GET");
  transport.setEndOfInputHint(TransportHint::Error);
  HeadReader reader(transport, config);
  EXPECT_EQ(reader.read(), HeadReader::Status::Error);
}

TEST_F(HeadReaderTest, BodyWithoutContentLengthIsWhatFollowsTheHead) {
  StringTransport transport("POST /x HTTP/1.1\r\n\r\nraw-body");
  HeadReader reader(transport, config);
  ASSERT_EQ(reader.read(), HeadReader::Status::Ok);
  EXPECT_EQ(reader.body(), "raw-body");
}

TEST_F(HeadReaderTest, BodyIsCompletedUpToContentLength) {
  config.withReadChunkBytes(16);
  const std::string body(500, 'q');
  StringTransport transport("POST /upload HTTP/1.1\r\ncontent-length: 500\r\n\r\n" + body + "extra", 7);
  HeadReader reader(transport, config);
  ASSERT_EQ(reader.read(), HeadReader::Status::Ok);
  EXPECT_EQ(reader.body(), body);
}

TEST_F(HeadReaderTest, BodyTooLarge) {
  config.withMaxBodyBytes(10);
  StringTransport transport("POST / HTTP/1.1\r\nContent-Length: 11\r\n\r\n01234567890");
  HeadReader reader(transport, config);
  EXPECT_EQ(reader.read(), HeadReader::Status::BodyTooLarge);
}

TEST_F(HeadReaderTest, InvalidContentLength) {
  StringTransport transport("POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
  HeadReader reader(transport, config);
  EXPECT_EQ(reader.read(), HeadReader::Status::BadLength);
}

TEST_F(HeadReaderTest, ShortBodyOnPeerClose) {
  StringTransport transport("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc");
  HeadReader reader(transport, config);
  ASSERT_EQ(reader.read(), HeadReader::Status::Ok);
  EXPECT_EQ(reader.body(), "abc");
}

TEST(HeadReaderStatus, ToString) {
  EXPECT_EQ(HeadReaderStatusToString(HeadReader::Status::TooLarge), "TooLarge");
  EXPECT_EQ(HeadReaderStatusToString(HeadReader::Status::Timeout), "Timeout");
}

}  // namespace vermouth
