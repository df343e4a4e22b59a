#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "vermouth/transport.hpp"

namespace vermouth::test {

// In-memory ITransport double.
// Reads are served from 'input', at most 'maxReadChunk' bytes at a time; once the input is exhausted,
// reads return 'endOfInputHint' (None = orderly close by the peer).
// Writes are appended to 'output', up to 'writeBudget' bytes, after which writes fail with 'writeFailureHint'.
class StringTransport : public ITransport {
 public:
  static constexpr std::size_t kUnlimited = static_cast<std::size_t>(-1);

  explicit StringTransport(std::string input = {}, std::size_t maxReadChunk = kUnlimited)
      : _input(std::move(input)), _maxReadChunk(maxReadChunk) {}

  using ITransport::write;

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  void shutdown() noexcept override { ++_nbShutdowns; }

  // Everything written so far.
  [[nodiscard]] const std::string& output() const noexcept { return _output; }

  [[nodiscard]] std::size_t nbReadCalls() const noexcept { return _nbReadCalls; }

  [[nodiscard]] std::size_t nbShutdowns() const noexcept { return _nbShutdowns; }

  void setEndOfInputHint(TransportHint hint) noexcept { _endOfInputHint = hint; }

  void setWriteBudget(std::size_t nbBytes, TransportHint failureHint = TransportHint::Error) noexcept {
    _writeBudget = nbBytes;
    _writeFailureHint = failureHint;
  }

 private:
  std::string _input;
  std::string _output;
  std::size_t _readPos{0};
  std::size_t _maxReadChunk;
  std::size_t _writeBudget{kUnlimited};
  std::size_t _nbReadCalls{0};
  std::size_t _nbShutdowns{0};
  TransportHint _endOfInputHint{TransportHint::None};
  TransportHint _writeFailureHint{TransportHint::Error};
};

}  // namespace vermouth::test
