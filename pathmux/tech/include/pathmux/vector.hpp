#pragma once

#include <amc/vector.hpp>

namespace pathmux {

template <class T>
using vector = amc::vector<T>;

}  // namespace pathmux
