#include "vermouth/head-reader.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <string_view>
#include <system_error>
#include <vector>

#include "vermouth/http-constants.hpp"
#include "vermouth/log.hpp"
#include "vermouth/string-equal-ignore-case.hpp"
#include "vermouth/string-trim.hpp"
#include "vermouth/transport.hpp"

namespace vermouth {

namespace {

void SplitLines(std::string_view head, std::vector<std::string_view>& lines) {
  lines.clear();
  while (!head.empty()) {
    const auto crlfPos = head.find(http::CRLF);
    if (crlfPos == std::string_view::npos) {
      lines.push_back(head);
      break;
    }
    lines.push_back(head.substr(0, crlfPos));
    head.remove_prefix(crlfPos + http::CRLF.size());
  }
}

struct ContentLengthSearch {
  bool found{false};
  bool valid{true};
  std::size_t value{0};
};

// Last Content-Length header of the head wins, consistently with the request decoder.
ContentLengthSearch FindContentLength(std::string_view head) {
  ContentLengthSearch ret;
  std::vector<std::string_view> lines;
  SplitLines(head, lines);
  for (std::size_t lineIdx = 1; lineIdx < lines.size(); ++lineIdx) {
    const std::string_view line = lines[lineIdx];
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos ||
        !CaseInsensitiveEqual(TrimOws(line.substr(0, colonPos)), http::ContentLength)) {
      continue;
    }
    const std::string_view value = TrimOws(line.substr(colonPos + 1));
    ret.found = true;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ret.value);
    ret.valid = !value.empty() && ec == std::errc{} && ptr == value.data() + value.size();
  }
  return ret;
}

}  // namespace

std::string_view HeadReaderStatusToString(HeadReader::Status status) noexcept {
  switch (status) {
    case HeadReader::Status::Ok:
      return "Ok";
    case HeadReader::Status::Closed:
      return "Closed";
    case HeadReader::Status::TooLarge:
      return "TooLarge";
    case HeadReader::Status::BodyTooLarge:
      return "BodyTooLarge";
    case HeadReader::Status::BadLength:
      return "BadLength";
    case HeadReader::Status::Timeout:
      return "Timeout";
    case HeadReader::Status::Error:
      return "Error";
    default:
      return "Unknown";
  }
}

std::size_t HeadReader::readChunk(std::size_t len, TransportHint& hint) {
  const std::size_t oldSize = _buffer.size();
  _buffer.resize(oldSize + len);
  const auto [bytesRead, want] = _transport.read(_buffer.data() + oldSize, len);
  _buffer.resize(oldSize + bytesRead);
  hint = want;
  return bytesRead;
}

HeadReader::Status HeadReader::read() {
  _buffer.clear();
  _lines.clear();
  _body = {};

  // Collect the head
  std::size_t headEnd = std::string_view::npos;
  std::size_t searchFrom = 0;
  bool peerClosed = false;
  while (true) {
    const std::string_view buffered(_buffer);
    headEnd = buffered.find(http::DoubleCRLF, searchFrom);
    if (headEnd != std::string_view::npos) {
      break;
    }
    if (_buffer.size() >= _config.maxHeaderBytes) {
      log::warn("Request head exceeds {} bytes", _config.maxHeaderBytes);
      return Status::TooLarge;
    }
    // the terminator may straddle two reads
    searchFrom = _buffer.size() < http::DoubleCRLF.size() ? 0 : _buffer.size() - (http::DoubleCRLF.size() - 1);

    TransportHint hint;
    if (readChunk(_config.readChunkBytes, hint) == 0) {
      if (hint == TransportHint::Timeout) {
        log::debug("Read deadline expired after {} bytes of request head", _buffer.size());
        return Status::Timeout;
      }
      if (hint == TransportHint::Error) {
        return Status::Error;
      }
      if (_buffer.empty()) {
        return Status::Closed;
      }
      log::debug("Peer closed mid-head after {} bytes, decoding it as is", _buffer.size());
      peerClosed = true;
      break;
    }
  }

  if (peerClosed) {
    // Unterminated head: no body can follow
    SplitLines(_buffer, _lines);
    return Status::Ok;
  }

  const std::size_t bodyStart = headEnd + http::DoubleCRLF.size();
  if (bodyStart > _config.maxHeaderBytes) {
    log::warn("Request head of {} bytes exceeds {} bytes", bodyStart, _config.maxHeaderBytes);
    return Status::TooLarge;
  }

  const auto contentLength = FindContentLength(std::string_view(_buffer).substr(0, headEnd));
  if (!contentLength.valid) {
    log::warn("Invalid Content-Length header");
    return Status::BadLength;
  }

  if (contentLength.found) {
    if (contentLength.value > _config.maxBodyBytes) {
      log::warn("Request body of {} bytes exceeds {} bytes", contentLength.value, _config.maxBodyBytes);
      return Status::BodyTooLarge;
    }
    while (_buffer.size() - bodyStart < contentLength.value) {
      const std::size_t missing = contentLength.value - (_buffer.size() - bodyStart);
      TransportHint hint;
      if (readChunk(missing, hint) == 0) {
        if (hint == TransportHint::Timeout) {
          return Status::Timeout;
        }
        if (hint == TransportHint::Error) {
          return Status::Error;
        }
        log::debug("Peer closed with {} body bytes missing", missing);
        break;
      }
    }
    // No pipelining: bytes past the announced body are dropped
    _buffer.resize(std::min(_buffer.size(), bodyStart + contentLength.value));
  } else if (_buffer.size() - bodyStart > _config.maxBodyBytes) {
    return Status::BodyTooLarge;
  }

  const std::string_view buffered(_buffer);
  SplitLines(buffered.substr(0, headEnd), _lines);
  _body = buffered.substr(bodyStart);
  return Status::Ok;
}

}  // namespace vermouth
