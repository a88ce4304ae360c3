#include "pathmux/router.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

#include "pathmux/http-method-set.hpp"
#include "pathmux/http-method.hpp"
#include "pathmux/http-response.hpp"
#include "pathmux/log.hpp"
#include "pathmux/path-handlers.hpp"
#include "pathmux/request-context.hpp"
#include "pathmux/route-entry.hpp"
#include "pathmux/route-node.hpp"
#include "pathmux/route-pattern.hpp"
#include "pathmux/router-config.hpp"

namespace pathmux {
namespace {

RouteNode::Kind NodeKind(PatternSegment::Type type) {
  switch (type) {
    case PatternSegment::Type::Param:
      return RouteNode::Kind::Param;
    case PatternSegment::Type::Slash:
      return RouteNode::Kind::Slash;
    default:
      return RouteNode::Kind::Literal;
  }
}

// Pops the next segment of path. hasMore is set to false when the returned segment is the last one.
// prerequisite: hasMore is true
std::string_view NextSegment(std::string_view& path, bool& hasMore) {
  const std::size_t nextSlash = path.find('/');
  if (nextSlash == std::string_view::npos) {
    hasMore = false;
    return path;
  }
  const std::string_view segment = path.substr(0, nextSlash);
  path.remove_prefix(nextSlash + 1U);
  return segment;
}

}  // namespace

Router::Router(RouterConfig config) : _config(std::move(config)) { _config.validate(); }

Router::Router(const Router& other) : _config(other._config), _defaultHandlers(other._defaultHandlers) {
  cloneNodesFrom(other);
}

Router& Router::operator=(const Router& other) {
  if (this != &other) {
    _config = other._config;
    _defaultHandlers = other._defaultHandlers;
    cloneNodesFrom(other);
  }
  return *this;
}

Router::Router(Router&& other) noexcept
    : _config(std::move(other._config)),
      _defaultHandlers(std::move(other._defaultHandlers)),
      _nodePool(std::move(other._nodePool)),
      _pRootRouteNode(std::exchange(other._pRootRouteNode, nullptr)) {}

Router& Router::operator=(Router&& other) noexcept {
  if (this != &other) {
    _config = std::move(other._config);
    _defaultHandlers = std::move(other._defaultHandlers);
    _nodePool = std::move(other._nodePool);
    _pRootRouteNode = std::exchange(other._pRootRouteNode, nullptr);
  }
  return *this;
}

RouteNode& Router::rootNode() {
  if (_pRootRouteNode == nullptr) {
    _pRootRouteNode = _nodePool.allocateAndConstruct();
  }
  return *_pRootRouteNode;
}

RouteEntry Router::setPath(const http::MethodSet& methods, std::string_view pattern, RequestHandler handler) {
  if (pattern.empty()) {
    log::debug("Ignoring registration of an empty pattern");
    return {};
  }
  if (methods.empty()) {
    log::error("No method given for pattern '{}'", pattern);
    throw std::invalid_argument("Method set cannot be empty");
  }
  if (!handler) {
    throw std::invalid_argument("Cannot set empty RequestHandler");
  }

  // Compile and check before touching the trie so that a failed registration leaves it unchanged
  const RoutePattern compiled = RoutePattern::Compile(pattern);
  checkParamNames(compiled);

  RouteNode* pNode = &rootNode();
  if (compiled.isRoot()) {
    pNode->mergeAllowedMethods(methods);
  }
  for (const PatternSegment& segment : compiled.segments()) {
    pNode = ensureChild(*pNode, segment, methods);
  }

  for (const http::MethodKey& method : methods) {
    if (pNode->setHandler(method, handler) && _config.warnOnOverwrite) {
      log::warn("Overwriting existing path handler for {} {}", method.displayName(), pNode->patternString());
    }
  }

  return {pNode, _config.warnOnOverwrite};
}

RouteEntry Router::setPath(const http::MethodKey& method, std::string_view pattern, RequestHandler handler) {
  return setPath(http::MethodSet{method}, pattern, std::move(handler));
}

RouteEntry Router::get(std::string_view pattern, RequestHandler handler) {
  return setPath(http::MethodSet::Get(), pattern, std::move(handler));
}

RouteEntry Router::post(std::string_view pattern, RequestHandler handler) {
  return setPath(http::MethodSet::Post(), pattern, std::move(handler));
}

RouteEntry Router::put(std::string_view pattern, RequestHandler handler) {
  return setPath(http::MethodSet::Put(), pattern, std::move(handler));
}

RouteEntry Router::del(std::string_view pattern, RequestHandler handler) {
  return setPath(http::MethodSet::Delete(), pattern, std::move(handler));
}

RouteEntry Router::any(std::string_view pattern, RequestHandler handler) {
  return setPath(http::MethodSet::Any(), pattern, std::move(handler));
}

void Router::setDefault(const http::MethodSet& methods, RequestHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Cannot set empty default RequestHandler");
  }
  for (const http::MethodKey& method : methods) {
    if (AssignMethodHandler(_defaultHandlers, method, handler) && _config.warnOnOverwrite) {
      log::warn("Overwriting existing default handler for {}", method.displayName());
    }
  }
}

void Router::setDefault(RequestHandler handler) { setDefault(http::MethodSet::Any(), std::move(handler)); }

void Router::checkParamNames(const RoutePattern& pattern) const {
  const RouteNode* pNode = _pRootRouteNode;
  for (auto it = pattern.segments().begin(); pNode != nullptr && it != pattern.segments().end(); ++it) {
    const PatternSegment& segment = *it;
    if (segment.type == PatternSegment::Type::Param) {
      pNode = pNode->paramChild();
      if (pNode != nullptr && pNode->name() != segment.text) {
        log::error("Parameter '{}' of pattern '{}' conflicts with existing route {}", segment.text, pattern.str(),
                   pNode->patternString());
        throw std::logic_error("Conflicting parameter naming at the same path position");
      }
    } else {
      pNode = pNode->literalChild(segment.text);
    }
  }
}

RouteNode* Router::ensureChild(RouteNode& node, const PatternSegment& segment, const http::MethodSet& methods) {
  const RouteNode::Kind kind = NodeKind(segment.type);
  RouteNode* pChild = node.child(kind, segment.text);
  if (pChild != nullptr) {
    pChild->mergeAllowedMethods(methods);
    return pChild;
  }
  pChild = _nodePool.allocateAndConstruct(kind, segment.text, &node, methods);
  node.attachChild(pChild);
  return pChild;
}

Router::RoutingResult Router::match(std::string_view method, std::string_view path) const {
  RoutingResult result;
  if (_pRootRouteNode == nullptr) {
    result.handler = defaultHandler(method);
    result.outcome = result.handler == nullptr ? RoutingResult::Outcome::NotFound : RoutingResult::Outcome::Default;
    return result;
  }

  if (!path.empty() && path.front() == '/') {
    path.remove_prefix(1U);
  }

  const RouteNode* pNode = _pRootRouteNode;
  for (bool hasMore = !path.empty(); hasMore;) {
    const std::string_view segment = NextSegment(path, hasMore);

    const RouteNode* pChild = pNode->literalChild(segment);
    if (pChild == nullptr) {
      const RouteNode* pParamChild = pNode->paramChild();
      if (pParamChild == nullptr || !pParamChild->allowedMethods().containsOrAny(method)) {
        resolveFailure(*pNode, false, method, result);
        return result;
      }
      result.pathParams.set(pParamChild->name(), segment);
      pNode = pParamChild;
      continue;
    }

    if (!pChild->allowedMethods().containsOrAny(method)) {
      // the node exists but does not accept this method
      resolveFailure(*pChild, !hasMore, method, result);
      return result;
    }
    pNode = pChild;
  }

  const RequestHandler* pHandler = pNode->handler(method);
  if (pHandler == nullptr) {
    // structural node, or endpoint without handler for this method
    resolveFailure(*pNode, true, method, result);
    return result;
  }
  result.handler = pHandler;
  result.outcome = RoutingResult::Outcome::Endpoint;
  return result;
}

void Router::resolveFailure(const RouteNode& start, bool exact, std::string_view method, RoutingResult& result) const {
  const RequestHandler* pHandler = nullptr;
  if (exact) {
    pHandler = start.catchAllHandler(method);
  }
  for (const RouteNode* pNode = &start; pHandler == nullptr && pNode != nullptr; pNode = pNode->parent()) {
    const RouteNode* pDirectoryNode = pNode->directoryNode();
    if (pDirectoryNode != nullptr && (!exact || pDirectoryNode != &start)) {
      pHandler = pDirectoryNode->catchAllHandler(method);
    }
  }
  if (pHandler != nullptr) {
    result.handler = pHandler;
    result.outcome = RoutingResult::Outcome::CatchAll;
    return;
  }

  result.pathParams.clear();
  result.handler = defaultHandler(method);
  result.outcome = result.handler == nullptr ? RoutingResult::Outcome::NotFound : RoutingResult::Outcome::Default;
}

HttpResponse Router::serve(std::string_view method, std::string_view path, std::string_view body) const {
  const RoutingResult result = match(method, path);
  if (!result.hasHandler()) {
    log::debug("No handler found for {} {}", method, path);
    if (_config.notFoundBody.empty()) {
      return HttpResponse(_config.notFoundStatusCode);
    }
    return {_config.notFoundStatusCode, _config.notFoundBody, http::ContentTypeTextPlain};
  }

  HttpResponse response;
  RequestContext ctx(method, path, body, result.pathParams, response);
  (*result.handler)(ctx);
  return response;
}

http::MethodSet Router::allowedMethods(std::string_view path) const {
  if (_pRootRouteNode == nullptr) {
    return {};
  }
  if (!path.empty() && path.front() == '/') {
    path.remove_prefix(1U);
  }

  const RouteNode* pNode = _pRootRouteNode;
  for (bool hasMore = !path.empty(); hasMore;) {
    const std::string_view segment = NextSegment(path, hasMore);
    const RouteNode* pChild = pNode->literalChild(segment);
    if (pChild == nullptr) {
      pChild = pNode->paramChild();
      if (pChild == nullptr) {
        return {};
      }
    }
    pNode = pChild;
  }
  return pNode->allowedMethods();
}

void Router::clear() noexcept {
  _defaultHandlers.clear();
  _pRootRouteNode = nullptr;
  _nodePool.reset();
}

void Router::cloneNodesFrom(const Router& other) {
  _pRootRouteNode = nullptr;
  _nodePool.reset();
  if (other._pRootRouteNode == nullptr) {
    return;
  }
  RouteNode& root = rootNode();
  root.mergeAllowedMethods(other._pRootRouteNode->allowedMethods());
  root.copyHandlersFrom(*other._pRootRouteNode);
  cloneChildren(*other._pRootRouteNode, root);
}

void Router::cloneChildren(const RouteNode& source, RouteNode& target) {
  auto cloneChild = [this, &target](const RouteNode& sourceChild) {
    RouteNode* pChild =
        _nodePool.allocateAndConstruct(sourceChild.kind(), sourceChild.name(), &target, sourceChild.allowedMethods());
    pChild->copyHandlersFrom(sourceChild);
    target.attachChild(pChild);
    cloneChildren(sourceChild, *pChild);
  };

  for (const auto& [name, pChild] : source._literalChildren) {
    cloneChild(*pChild);
  }
  if (source._paramChild != nullptr) {
    cloneChild(*source._paramChild);
  }
  if (source._slashChild != nullptr) {
    cloneChild(*source._slashChild);
  }
}

}  // namespace pathmux
