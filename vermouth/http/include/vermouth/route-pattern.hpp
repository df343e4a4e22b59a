#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "vermouth/path-params.hpp"

namespace vermouth {

// Compiled route path pattern, for instance '/users/:id/files/:path*'.
// Segments are delimited by '/':
//  - 'name'   literal segment, compared exactly (case-sensitive)
//  - ':name'  captures exactly one path segment (possibly empty)
//  - ':name*' captures the remainder of the path, segments joined with '/', and ends matching
// Segment kinds are determined once, at construction.
class RoutePattern {
 public:
  enum class SegmentKind : std::uint8_t { Literal, Param, Wildcard };

  struct Segment {
    SegmentKind kind;
    std::string text;  // literal text, or parameter name

    bool operator==(const Segment&) const noexcept = default;
  };

  // Throws std::invalid_argument if 'pattern' does not start with '/' or has a parameter with an empty name.
  explicit RoutePattern(std::string_view pattern);

  // Tells whether 'path' matches this pattern. On success, 'pathParams' is cleared then filled with the captures.
  // On failure, the content of 'pathParams' is unspecified.
  [[nodiscard]] bool match(std::string_view path, PathParams& pathParams) const;

  // The pattern as registered.
  [[nodiscard]] std::string_view str() const noexcept { return _pattern; }

  [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return _segments; }

 private:
  std::string _pattern;
  std::vector<Segment> _segments;
};

}  // namespace vermouth
