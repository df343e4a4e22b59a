#include "vermouth/transport.hpp"

#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string_view>

#include "vermouth/log.hpp"
#include "vermouth/socket-ops.hpp"

namespace vermouth {

namespace {

TransportHint HintFromErrno(int err) {
  // SO_RCVTIMEO / SO_SNDTIMEO expiry surfaces as EAGAIN on a blocking socket
  if (err == EAGAIN || err == EWOULDBLOCK) {
    return TransportHint::Timeout;
  }
  return TransportHint::Error;
}

}  // namespace

ITransport::TransportResult PlainTransport::read(char* buf, std::size_t len) {
  while (true) {
    const auto nbRead = ::recv(_fd, buf, len, 0);
    if (nbRead >= 0) {
      return {static_cast<std::size_t>(nbRead), TransportHint::None};
    }
    if (errno != EINTR) {
      log::debug("read on fd # {} failed: {}", _fd, std::strerror(errno));
      return {0, HintFromErrno(errno)};
    }
  }
}

ITransport::TransportResult PlainTransport::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};
  while (ret.bytesProcessed < data.size()) {
    const auto nbWritten = SafeSend(_fd, data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed);
    if (nbWritten == -1) {
      if (errno == EINTR) {
        continue;
      }
      log::debug("write on fd # {} failed: {}", _fd, std::strerror(errno));
      ret.want = HintFromErrno(errno);
      break;
    }
    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }
  return ret;
}

ITransport::TransportResult PlainTransport::write(std::string_view head, std::string_view body) {
  // Scatter-gather first: a single syscall for head and body in the common case.
  std::array<iovec, 2> iov{{{const_cast<char*>(head.data()), head.size()},  // NOLINT(cppcoreguidelines-pro-type-const-cast)
                            {const_cast<char*>(body.data()), body.size()}}};  // NOLINT(cppcoreguidelines-pro-type-const-cast)
  msghdr msg{};
  msg.msg_iov = iov.data();
  msg.msg_iovlen = iov.size();

  ssize_t nbWritten;
  do {
    nbWritten = ::sendmsg(_fd, &msg, MSG_NOSIGNAL);
  } while (nbWritten == -1 && errno == EINTR);

  if (nbWritten == -1) {
    log::debug("sendmsg on fd # {} failed: {}", _fd, std::strerror(errno));
    return {0, HintFromErrno(errno)};
  }

  // Partial write: finish the remaining bytes with plain writes.
  auto written = static_cast<std::size_t>(nbWritten);
  TransportResult ret{written, TransportHint::None};
  if (written < head.size()) {
    auto rest = ITransport::write(head.substr(written), body);
    ret.bytesProcessed += rest.bytesProcessed;
    ret.want = rest.want;
  } else if (written < head.size() + body.size()) {
    auto rest = write(body.substr(written - head.size()));
    ret.bytesProcessed += rest.bytesProcessed;
    ret.want = rest.want;
  }
  return ret;
}

void PlainTransport::shutdown() noexcept {
  if (!ShutdownReadWrite(_fd)) {
    log::debug("shutdown on fd # {} failed: {}", _fd, std::strerror(errno));
  }
}

}  // namespace vermouth
