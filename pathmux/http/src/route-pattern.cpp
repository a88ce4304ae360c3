#include "pathmux/route-pattern.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "pathmux/log.hpp"

namespace pathmux {
namespace {

constexpr char kOpenBrace = '{';
constexpr char kCloseBrace = '}';

PatternSegment CompileSegment(std::string_view pattern, std::string_view segment) {
  if (segment.empty()) {
    return {PatternSegment::Type::Slash, segment};
  }
  const bool opens = segment.front() == kOpenBrace;
  const bool closes = segment.back() == kCloseBrace;
  if (!opens && !closes) {
    return {PatternSegment::Type::Literal, segment};
  }
  if (!opens || !closes || segment.size() == 1U) {
    log::error("Unbalanced braces in segment '{}' of pattern '{}'", segment, pattern);
    throw std::invalid_argument("Unbalanced braces in route pattern");
  }
  const std::string_view name = segment.substr(1U, segment.size() - 2U);
  if (name.empty()) {
    log::error("Empty parameter name in pattern '{}'", pattern);
    throw std::invalid_argument("Empty parameter name in route pattern");
  }
  if (name.find_first_of("{}") != std::string_view::npos) {
    log::error("Invalid parameter name '{}' in pattern '{}'", name, pattern);
    throw std::invalid_argument("Unbalanced braces in route pattern");
  }
  return {PatternSegment::Type::Param, name};
}

}  // namespace

RoutePattern RoutePattern::Compile(std::string_view pattern) {
  if (pattern.empty()) {
    throw std::invalid_argument("Route pattern cannot be empty");
  }

  RoutePattern compiled(pattern);
  if (pattern == "/") {
    return compiled;
  }

  std::string_view remaining = pattern;
  if (remaining.front() == '/') {
    remaining.remove_prefix(1U);
  }

  for (;;) {
    const std::size_t nextSlash = remaining.find('/');
    if (nextSlash == std::string_view::npos) {
      compiled._segments.push_back(CompileSegment(pattern, remaining));
      break;
    }
    compiled._segments.push_back(CompileSegment(pattern, remaining.substr(0, nextSlash)));
    remaining.remove_prefix(nextSlash + 1U);
  }

  return compiled;
}

bool RoutePattern::hasParams() const noexcept {
  return std::ranges::any_of(_segments,
                             [](const PatternSegment& segment) { return segment.type == PatternSegment::Type::Param; });
}

}  // namespace pathmux
