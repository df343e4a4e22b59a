#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vermouth {

// Indicates why a blocking I/O operation stopped before processing the requested bytes.
enum class TransportHint : uint8_t {
  None,     // Operation completed (for reads, 0 bytes with None means orderly close by the peer)
  Timeout,  // The socket deadline (SO_RCVTIMEO / SO_SNDTIMEO) expired
  Error     // Fatal error (ECONNRESET, EPIPE, ...)
};

// Base transport abstraction over a connected stream.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
    TransportHint want;
  };

  // Blocking read of at most len bytes.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Blocking write of the whole buffer. bytesProcessed < data.size() only if want != None.
  virtual TransportResult write(std::string_view data) = 0;

  // Writes head then body. Body bytes are never sent if the head was not fully written.
  virtual TransportResult write(std::string_view head, std::string_view body) {
    TransportResult result = write(head);
    if (result.want != TransportHint::None || body.empty()) {
      return result;
    }
    const auto [bytesWritten, want] = write(body);
    result.bytesProcessed += bytesWritten;
    result.want = want;
    return result;
  }

  // Terminates both directions of the stream. Further writes fail.
  virtual void shutdown() noexcept = 0;
};

// Plain transport operating on a blocking socket fd, which it does not own.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  TransportResult write(std::string_view head, std::string_view body) override;

  void shutdown() noexcept override;

 private:
  int _fd;
};

}  // namespace vermouth
