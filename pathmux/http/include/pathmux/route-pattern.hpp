#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "pathmux/vector.hpp"

namespace pathmux {

struct PatternSegment {
  enum class Type : std::uint8_t {
    Literal,  // matches the segment text exactly
    Param,    // matches any segment, captured under text
    Slash     // empty segment, produced by a trailing slash or by two adjacent slashes
  };

  bool operator==(const PatternSegment&) const noexcept = default;

  Type type;
  std::string_view text;  // literal text or capture name, empty for Slash
};

// Compiled form of a route pattern such as "/users/{id}/posts/".
//
// Syntax:
//  - the pattern is split on '/', after removal of a single leading '/'.
//  - a segment wrapped in braces ("{id}") is a parameter, captured under the name between the braces.
//  - an empty segment (trailing slash, or two adjacent slashes) is a distinct literal: "/a" and "/a/" are two
//    different routes.
//  - "/" is the root route and has no segments.
//
// Segments point into the original pattern which must outlive the RoutePattern.
class RoutePattern {
 public:
  // Compiles pattern.
  // Throws std::invalid_argument if pattern is empty or contains a malformed parameter segment: unbalanced braces,
  // empty capture name, or brace inside a capture name.
  [[nodiscard]] static RoutePattern Compile(std::string_view pattern);

  // The original pattern.
  [[nodiscard]] std::string_view str() const noexcept { return _pattern; }

  [[nodiscard]] std::span<const PatternSegment> segments() const noexcept { return _segments; }

  // True for "/".
  [[nodiscard]] bool isRoot() const noexcept { return _segments.empty(); }

  [[nodiscard]] bool hasParams() const noexcept;

 private:
  explicit RoutePattern(std::string_view pattern) noexcept : _pattern(pattern) {}

  std::string_view _pattern;
  vector<PatternSegment> _segments;
};

}  // namespace pathmux
