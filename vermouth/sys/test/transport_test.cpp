#include "vermouth/transport.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>

#include "vermouth/base-fd.hpp"
#include "vermouth/socket-ops.hpp"

namespace vermouth {

class PlainTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    int fds[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds));
    serverSide = BaseFd(fds[0]);
    clientSide = BaseFd(fds[1]);
  }

  std::string readAllFromClient() {
    std::string out;
    char buf[256];
    while (true) {
      const auto nbRead = ::recv(clientSide.fd(), buf, sizeof(buf), 0);
      if (nbRead <= 0) {
        break;
      }
      out.append(buf, static_cast<std::size_t>(nbRead));
    }
    return out;
  }

  BaseFd serverSide;
  BaseFd clientSide;
};

TEST_F(PlainTransportTest, ReadReturnsAvailableBytes) {
  ASSERT_EQ(SafeSend(clientSide.fd(), std::string_view("hello")), 5);
  PlainTransport transport(serverSide.fd());
  char buf[16];
  const auto res = transport.read(buf, sizeof(buf));
  EXPECT_EQ(res.want, TransportHint::None);
  EXPECT_EQ(std::string_view(buf, res.bytesProcessed), "hello");
}

TEST_F(PlainTransportTest, ReadReportsOrderlyClose) {
  clientSide.close();
  PlainTransport transport(serverSide.fd());
  char buf[16];
  const auto res = transport.read(buf, sizeof(buf));
  EXPECT_EQ(res.bytesProcessed, 0U);
  EXPECT_EQ(res.want, TransportHint::None);
}

TEST_F(PlainTransportTest, ReadReportsTimeout) {
  ASSERT_TRUE(SetRecvTimeout(serverSide.fd(), std::chrono::milliseconds{20}));
  PlainTransport transport(serverSide.fd());
  char buf[16];
  const auto res = transport.read(buf, sizeof(buf));
  EXPECT_EQ(res.bytesProcessed, 0U);
  EXPECT_EQ(res.want, TransportHint::Timeout);
}

TEST_F(PlainTransportTest, WriteHeadAndBody) {
  PlainTransport transport(serverSide.fd());
  const auto res = transport.write("HEAD|", "BODY");
  EXPECT_EQ(res.bytesProcessed, 9U);
  EXPECT_EQ(res.want, TransportHint::None);
  serverSide.close();
  EXPECT_EQ(readAllFromClient(), "HEAD|BODY");
}

TEST_F(PlainTransportTest, WriteLargePayload) {
  const std::string body(1 << 20, 'x');
  std::string received;
  {
    std::jthread reader([&] { received = readAllFromClient(); });
    PlainTransport transport(serverSide.fd());
    const auto res = transport.write("head", body);
    EXPECT_EQ(res.bytesProcessed, 4U + body.size());
    EXPECT_EQ(res.want, TransportHint::None);
    serverSide.close();
  }
  EXPECT_EQ(received.size(), 4U + body.size());
}

TEST_F(PlainTransportTest, WriteAfterPeerClosedFails) {
  clientSide.close();
  PlainTransport transport(serverSide.fd());
  const std::string payload(1 << 16, 'y');
  auto res = transport.write(payload);
  if (res.want == TransportHint::None) {
    // first write may be buffered by the kernel
    res = transport.write(payload);
  }
  EXPECT_EQ(res.want, TransportHint::Error);
}

TEST(PlainTransport, InvalidFd) {
  PlainTransport transport(-1);
  char buf[16];
  EXPECT_EQ(transport.read(buf, sizeof(buf)).want, TransportHint::Error);
  EXPECT_EQ(transport.write("hello").want, TransportHint::Error);
}

}  // namespace vermouth
