#include "vermouth/string-transport.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string_view>

namespace vermouth::test {

ITransport::TransportResult StringTransport::read(char* buf, std::size_t len) {
  ++_nbReadCalls;
  const std::size_t remaining = _input.size() - _readPos;
  if (remaining == 0) {
    return {0, _endOfInputHint};
  }
  const std::size_t nbBytes = std::min({len, remaining, _maxReadChunk});
  std::memcpy(buf, _input.data() + _readPos, nbBytes);
  _readPos += nbBytes;
  return {nbBytes, TransportHint::None};
}

ITransport::TransportResult StringTransport::write(std::string_view data) {
  if (_nbShutdowns != 0) {
    return {0, TransportHint::Error};
  }
  const std::size_t nbBytes = std::min(data.size(), _writeBudget);
  _output.append(data.substr(0, nbBytes));
  if (_writeBudget != kUnlimited) {
    _writeBudget -= nbBytes;
  }
  if (nbBytes < data.size()) {
    return {nbBytes, _writeFailureHint};
  }
  return {nbBytes, TransportHint::None};
}

}  // namespace vermouth::test
