#pragma once

#include <city.h>

#include <cstddef>
#include <string_view>

namespace pathmux {

struct CityHash {
  std::size_t operator()(std::string_view str) const noexcept {
    return static_cast<std::size_t>(CityHash64(str.data(), str.size()));
  }
};

}  // namespace pathmux
