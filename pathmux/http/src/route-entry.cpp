#include "pathmux/route-entry.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "pathmux/http-method-set.hpp"
#include "pathmux/http-method.hpp"
#include "pathmux/log.hpp"
#include "pathmux/path-handlers.hpp"
#include "pathmux/route-node.hpp"

namespace pathmux {

std::string RouteEntry::pattern() const { return _pNode == nullptr ? std::string() : _pNode->patternString(); }

RouteEntry& RouteEntry::catchAll(const http::MethodSet& methods) {
  if (_pNode == nullptr) {
    return *this;
  }
  for (const http::MethodKey& method : methods) {
    if (_pNode->setCatchAll(method, RouteNode::CatchAll::Kind::Own, {}) && _warnOnOverwrite) {
      log::warn("Overwriting existing catch-all for {} {}", method.displayName(), _pNode->patternString());
    }
  }
  log::debug("Catch-all on {} served by its own handlers", _pNode->patternString());
  return *this;
}

RouteEntry& RouteEntry::catchAll(const http::MethodSet& methods, RequestHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Cannot set empty catch-all RequestHandler");
  }
  if (_pNode == nullptr) {
    return *this;
  }
  for (const http::MethodKey& method : methods) {
    if (_pNode->setCatchAll(method, RouteNode::CatchAll::Kind::Explicit, handler) && _warnOnOverwrite) {
      log::warn("Overwriting existing catch-all for {} {}", method.displayName(), _pNode->patternString());
    }
  }
  log::debug("Catch-all handler set on {}", _pNode->patternString());
  return *this;
}

}  // namespace pathmux
