#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "pathmux/http-method-set.hpp"
#include "pathmux/http-method.hpp"
#include "pathmux/http-response.hpp"
#include "pathmux/object-pool.hpp"
#include "pathmux/path-handlers.hpp"
#include "pathmux/path-params.hpp"
#include "pathmux/route-entry.hpp"
#include "pathmux/route-node.hpp"
#include "pathmux/route-pattern.hpp"
#include "pathmux/router-config.hpp"
#include "pathmux/vector.hpp"

namespace pathmux {

// Path based request router.
//
// Routes are registered with a pattern (see RoutePattern for the syntax), a set of methods and a handler. Requests are
// dispatched by walking the routing trie segment by segment. When the walk fails, the request is served, in order of
// precedence, by:
//   1. the catch-all of the node where the walk stopped, if the request ended exactly there,
//   2. the catch-all of the closest slash route ("/a/") above the point of failure (the root "/" being the last one),
//   3. the default handler registered for the method, then the default handler registered for Any,
//   4. the built-in not found response (see RouterConfig).
//
// Threading: registration is not synchronized and must be completed before dispatching starts. match(), serve() and
// allowedMethods() do not modify the router and may be called concurrently from any number of threads.
class Router {
 public:
  // Creates an empty Router with a default configuration.
  Router() = default;

  // Creates an empty Router with the given configuration.
  // Throws std::invalid_argument if the configuration is not valid.
  explicit Router(RouterConfig config);

  // Copy operations duplicate the whole routing trie including all registered handlers.
  // RouteEntry objects obtained from the source router still refer to the source router.
  Router(const Router& other);
  Router& operator=(const Router& other);

  // Move operations transfer ownership of the routing trie. RouteEntry objects stay valid.
  // The moved-from Router is left empty.
  Router(Router&& other) noexcept;
  Router& operator=(Router&& other) noexcept;

  ~Router() = default;

  // Register a handler for a pattern and a set of methods.
  //
  // Registering the same pattern and method twice keeps the last handler.
  // Nodes created or reused by the registration accept the given methods in addition to the ones they already had.
  // An empty pattern is ignored (the returned entry is not valid).
  //
  // Throws std::invalid_argument if the pattern is malformed, the method set empty or the handler empty.
  // Throws std::logic_error if a parameter segment has a different name than a parameter already registered at the same
  // position (there can be at most one parameter per position).
  // In all these cases, the router is left unchanged.
  RouteEntry setPath(const http::MethodSet& methods, std::string_view pattern, RequestHandler handler);

  // Register a handler for a pattern and a single method.
  RouteEntry setPath(const http::MethodKey& method, std::string_view pattern, RequestHandler handler);

  RouteEntry get(std::string_view pattern, RequestHandler handler);
  RouteEntry post(std::string_view pattern, RequestHandler handler);
  RouteEntry put(std::string_view pattern, RequestHandler handler);
  RouteEntry del(std::string_view pattern, RequestHandler handler);

  // Register a handler accepting any method.
  RouteEntry any(std::string_view pattern, RequestHandler handler);

  // Register the handler served for the given methods when a request matches no route and no catch-all.
  // Throws std::invalid_argument if handler is empty.
  void setDefault(const http::MethodSet& methods, RequestHandler handler);

  // Register the handler served for any method when a request matches no route and no catch-all.
  // Method specific default handlers take precedence.
  void setDefault(RequestHandler handler);

  struct RoutingResult {
    enum class Outcome : std::uint8_t {
      Endpoint,  // handler of the route matching the path
      CatchAll,  // catch-all of a route above the point of failure
      Default,   // router default handler
      NotFound   // nothing found, handler is nullptr
    };

    [[nodiscard]] bool hasHandler() const noexcept { return handler != nullptr; }

    // Points into the router storage, valid until the router is modified or destroyed.
    const RequestHandler* handler{nullptr};

    Outcome outcome{Outcome::NotFound};

    // Captures bound during the walk, empty for Default and NotFound outcomes.
    // Values point into the caller supplied path.
    PathParams pathParams;
  };

  // Resolve the handler to invoke for a request path and method.
  // A single leading '/' of path is ignored. A trailing slash is significant: "/a/" is a distinct route from "/a".
  // This method never fails: when nothing matches, the outcome is NotFound.
  [[nodiscard]] RoutingResult match(std::string_view method, std::string_view path) const;

  // Resolve the handler for the request and invoke it with a fresh RequestContext, returning the produced response.
  // When no handler is found, returns the built-in not found response.
  // Exceptions thrown by the handler are propagated.
  [[nodiscard]] HttpResponse serve(std::string_view method, std::string_view path, std::string_view body = {}) const;

  // Return the methods accepted by the route reached by path, regardless of the request method.
  // Returns an empty set if the path does not reach any route node.
  [[nodiscard]] http::MethodSet allowedMethods(std::string_view path) const;

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Number of nodes in the routing trie, root included (0 for an empty router).
  [[nodiscard]] std::size_t nbNodes() const noexcept { return _nodePool.size(); }

  // Clear all registered routes, catch-alls and default handlers.
  // The configuration stays unchanged. All RouteEntry previously returned become invalid.
  void clear() noexcept;

 private:
  RouteNode& rootNode();

  // Throws std::logic_error if the pattern declares a parameter with a different name than the existing one.
  void checkParamNames(const RoutePattern& pattern) const;

  RouteNode* ensureChild(RouteNode& node, const PatternSegment& segment, const http::MethodSet& methods);

  // Fills result for a walk that failed at (or ended without handler on) node start.
  // exact tells whether all the path segments were consumed when reaching start.
  void resolveFailure(const RouteNode& start, bool exact, std::string_view method, RoutingResult& result) const;

  [[nodiscard]] const RequestHandler* defaultHandler(std::string_view method) const noexcept {
    return FindMethodHandler(_defaultHandlers, method);
  }

  void cloneNodesFrom(const Router& other);

  void cloneChildren(const RouteNode& source, RouteNode& target);

  RouterConfig _config;
  vector<MethodHandler> _defaultHandlers;
  ObjectPool<RouteNode> _nodePool;
  RouteNode* _pRootRouteNode{nullptr};
};

}  // namespace pathmux
