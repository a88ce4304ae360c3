#pragma once

#include <amc/flatset.hpp>
#include <functional>

namespace pathmux {

// Sorted vector based set, cheap to copy and to iterate for the small cardinalities we use it for.
template <class T, class Compare = std::less<T>>
using FlatSet = amc::FlatSet<T, Compare>;

}  // namespace pathmux
