#include "vermouth/route-pattern.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "vermouth/path-params.hpp"

namespace vermouth {

namespace {

// Extracts the next '/' delimited segment from 'path' (which starts just after a '/').
// Returns false when 'path' has no more segments.
bool NextSegment(std::string_view& path, bool& exhausted, std::string_view& segment) {
  if (exhausted) {
    return false;
  }
  const auto slashPos = path.find('/');
  if (slashPos == std::string_view::npos) {
    segment = path;
    path = {};
    exhausted = true;
  } else {
    segment = path.substr(0, slashPos);
    path.remove_prefix(slashPos + 1);
  }
  return true;
}

}  // namespace

RoutePattern::RoutePattern(std::string_view pattern) : _pattern(pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument("Route pattern must start with '/': '" + _pattern + "'");
  }

  std::string_view rest = pattern.substr(1);
  bool exhausted = false;
  std::string_view segment;
  while (NextSegment(rest, exhausted, segment)) {
    if (!segment.empty() && segment.front() == ':') {
      std::string_view name = segment.substr(1);
      SegmentKind kind = SegmentKind::Param;
      if (!name.empty() && name.back() == '*') {
        name.remove_suffix(1);
        kind = SegmentKind::Wildcard;
      }
      if (name.empty()) {
        throw std::invalid_argument("Route pattern has a parameter with an empty name: '" + _pattern + "'");
      }
      _segments.push_back(Segment{kind, std::string(name)});
    } else {
      _segments.push_back(Segment{SegmentKind::Literal, std::string(segment)});
    }
  }
}

bool RoutePattern::match(std::string_view path, PathParams& pathParams) const {
  pathParams.clear();
  if (path.empty() || path.front() != '/') {
    return false;
  }

  std::string_view rest = path.substr(1);
  bool exhausted = false;
  std::string_view pathSegment;
  for (const Segment& segment : _segments) {
    if (segment.kind == SegmentKind::Wildcard) {
      // remainder of the path, possibly empty
      pathParams.set(segment.text, exhausted ? std::string_view{} : rest);
      return true;
    }
    if (!NextSegment(rest, exhausted, pathSegment)) {
      return false;
    }
    if (segment.kind == SegmentKind::Param) {
      pathParams.set(segment.text, pathSegment);
    } else if (segment.text != pathSegment) {
      return false;
    }
  }
  // segment counts must be equal
  return exhausted;
}

}  // namespace vermouth
