#pragma once

#include <compare>
#include <string>
#include <string_view>

namespace pathmux::http {

inline constexpr std::string_view MethodGet = "GET";
inline constexpr std::string_view MethodHead = "HEAD";
inline constexpr std::string_view MethodPost = "POST";
inline constexpr std::string_view MethodPut = "PUT";
inline constexpr std::string_view MethodDelete = "DELETE";
inline constexpr std::string_view MethodConnect = "CONNECT";
inline constexpr std::string_view MethodOptions = "OPTIONS";
inline constexpr std::string_view MethodTrace = "TRACE";
inline constexpr std::string_view MethodPatch = "PATCH";

// Identifies a request method in method sets and handler tables.
// A key is either a named method token (any non-empty token, standard or not) or the Any wildcard matching every
// method. The wildcard is a distinct tag: no method name, whatever its spelling, compares equal to it.
class MethodKey {
 public:
  // Spelling used to print the wildcard in diagnostics. It is not accepted as a method name.
  static constexpr std::string_view kAnyDisplayName = "*";

  // The wildcard key.
  [[nodiscard]] static MethodKey Any() noexcept { return {}; }

  // Named method key.
  // Throws std::invalid_argument if name is empty or equal to kAnyDisplayName.
  explicit MethodKey(std::string_view name);

  // Convenience implicit conversion from the method constants above ("GET", "POST", ...).
  MethodKey(const char *name) : MethodKey(std::string_view(name)) {}

  [[nodiscard]] bool isAny() const noexcept { return _isAny; }

  // Method token of a named key, empty for Any.
  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  // Printable form, for logs: the method name, or kAnyDisplayName for the wildcard.
  [[nodiscard]] std::string_view displayName() const noexcept { return _isAny ? kAnyDisplayName : _name; }

  // Whether this key designates exactly the given request method (never true for Any).
  [[nodiscard]] bool is(std::string_view method) const noexcept { return !_isAny && _name == method; }

  auto operator<=>(const MethodKey &) const = default;
  bool operator==(const MethodKey &) const = default;

 private:
  MethodKey() noexcept = default;

  // Named keys sort before the wildcard.
  bool _isAny{true};
  std::string _name;
};

}  // namespace pathmux::http
