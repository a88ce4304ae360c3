#pragma once

#include <string>

#include "pathmux/http-method-set.hpp"
#include "pathmux/path-handlers.hpp"

namespace pathmux {

class RouteNode;

// Handle on the route reached by a registration, returned by Router::setPath and its shortcuts.
// It allows further configuration of the route, for instance:
//
//   router.get("/files/", ListFiles).catchAll(http::MethodSet::Get());
//
// A RouteEntry stays valid as long as the Router it comes from is alive and not cleared.
// The entry returned for an ignored registration (empty pattern) is not valid and its setters are no-ops.
class RouteEntry {
 public:
  RouteEntry() noexcept = default;

  [[nodiscard]] bool valid() const noexcept { return _pNode != nullptr; }

  // Pattern of the route, such as "/users/{id}/". Empty for an invalid entry.
  [[nodiscard]] std::string pattern() const;

  // Makes the route's own handlers serve, for the given methods, the requests that reach this route but fail to match
  // anything more specific below it.
  // The catch-all of a slash route ("/a/") covers every request below "/a"; the catch-all of a route without trailing
  // slash only covers requests ending exactly at it (for instance with a method it does not accept).
  RouteEntry& catchAll(const http::MethodSet& methods);

  // Same as catchAll(methods), but the given handler serves the requests instead of the route's own handlers.
  // Throws std::invalid_argument if handler is empty.
  RouteEntry& catchAll(const http::MethodSet& methods, RequestHandler handler);

 private:
  friend class Router;

  RouteEntry(RouteNode* pNode, bool warnOnOverwrite) noexcept : _pNode(pNode), _warnOnOverwrite(warnOnOverwrite) {}

  RouteNode* _pNode{nullptr};
  bool _warnOnOverwrite{true};
};

}  // namespace pathmux
