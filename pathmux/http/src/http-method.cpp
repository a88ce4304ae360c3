#include "pathmux/http-method.hpp"

#include <stdexcept>
#include <string_view>

#include "pathmux/log.hpp"

namespace pathmux::http {

MethodKey::MethodKey(std::string_view name) : _isAny(false), _name(name) {
  if (name.empty()) {
    throw std::invalid_argument("Method name cannot be empty");
  }
  if (name == kAnyDisplayName) {
    log::error("'{}' is not a method name, use MethodKey::Any() for the wildcard", name);
    throw std::invalid_argument("Reserved method name");
  }
}

}  // namespace pathmux::http
