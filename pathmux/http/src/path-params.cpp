#include "pathmux/path-params.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

namespace pathmux {

void PathParams::set(std::string_view key, std::string_view value) {
  const auto it = std::ranges::find(_captures, key, &PathParamCapture::key);
  if (it != _captures.end()) {
    it->value = value;
  } else {
    _captures.emplace_back(key, value);
  }
}

std::optional<std::string_view> PathParams::find(std::string_view key) const noexcept {
  const auto it = std::ranges::find(_captures, key, &PathParamCapture::key);
  if (it == _captures.end()) {
    return std::nullopt;
  }
  return it->value;
}

}  // namespace pathmux
