#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "pathmux/vector.hpp"

namespace pathmux {

struct PathParamCapture {
  std::string_view key;
  std::string_view value;

  bool operator==(const PathParamCapture &) const noexcept = default;
};

// Captures of a dispatched request, mapping a parameter name to the path segment it matched.
// Captures are kept in path order. Keys point into the router's route names and values into the request path:
// copy them if they need to outlive either.
class PathParams {
 public:
  using const_iterator = vector<PathParamCapture>::const_iterator;

  // Binds key to value, replacing a previous capture of the same key (a name repeated deeper in a pattern wins).
  void set(std::string_view key, std::string_view value);

  // Returns the value captured for key, or std::nullopt if there is none.
  [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept;

  // Returns the value captured for key, or an empty string_view if there is none.
  [[nodiscard]] std::string_view valueOrEmpty(std::string_view key) const noexcept { return find(key).value_or(""); }

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _captures.size(); }

  [[nodiscard]] bool empty() const noexcept { return _captures.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _captures.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _captures.end(); }

  void clear() noexcept { _captures.clear(); }

 private:
  vector<PathParamCapture> _captures;
};

}  // namespace pathmux
