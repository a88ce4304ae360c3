#include "pathmux/route-node.hpp"

#include <algorithm>
#include <cassert>
#include <string>
#include <string_view>
#include <utility>

#include "pathmux/http-method-set.hpp"
#include "pathmux/http-method.hpp"
#include "pathmux/path-handlers.hpp"
#include "pathmux/vector.hpp"

namespace pathmux {

RouteNode::RouteNode(Kind kind, std::string_view name, RouteNode* parent, http::MethodSet allowedMethods)
    : _allowedMethods(std::move(allowedMethods)), _name(name), _parent(parent), _kind(kind) {
  assert(parent != nullptr && kind != Kind::Root);
}

void RouteNode::copyHandlersFrom(const RouteNode& other) {
  _handlers = other._handlers;
  _catchAlls = other._catchAlls;
}

const RouteNode* RouteNode::literalChild(std::string_view segment) const noexcept {
  if (segment.empty()) {
    return _slashChild;
  }
  const auto it = _literalChildren.find(segment);
  return it == _literalChildren.end() ? nullptr : it->second;
}

RouteNode* RouteNode::child(Kind kind, std::string_view text) noexcept {
  switch (kind) {
    case Kind::Literal: {
      const auto it = _literalChildren.find(text);
      return it == _literalChildren.end() ? nullptr : it->second;
    }
    case Kind::Param:
      return _paramChild;
    case Kind::Slash:
      return _slashChild;
    default:
      return nullptr;
  }
}

void RouteNode::attachChild(RouteNode* child) {
  switch (child->_kind) {
    case Kind::Literal:
      _literalChildren.emplace(std::string_view(child->_name), child);
      break;
    case Kind::Param:
      assert(_paramChild == nullptr);
      _paramChild = child;
      break;
    case Kind::Slash:
      assert(_slashChild == nullptr);
      _slashChild = child;
      break;
    default:
      assert(false);
      break;
  }
}

bool RouteNode::setCatchAll(const http::MethodKey& method, CatchAll::Kind kind, RequestHandler handler) {
  const auto it = std::ranges::find(_catchAlls, method, &CatchAll::method);
  if (it != _catchAlls.end()) {
    it->kind = kind;
    it->handler = std::move(handler);
    return true;
  }
  _catchAlls.emplace_back(method, kind, std::move(handler));
  return false;
}

const RouteNode::CatchAll* RouteNode::findCatchAll(std::string_view method) const noexcept {
  const CatchAll* pAnyEntry = nullptr;
  for (const CatchAll& entry : _catchAlls) {
    if (entry.method.is(method)) {
      return &entry;
    }
    if (entry.method.isAny()) {
      pAnyEntry = &entry;
    }
  }
  return pAnyEntry;
}

const RequestHandler* RouteNode::catchAllHandler(std::string_view method) const noexcept {
  const CatchAll* pEntry = findCatchAll(method);
  if (pEntry == nullptr) {
    return nullptr;
  }
  if (pEntry->kind == CatchAll::Kind::Own) {
    return handler(method);
  }
  return &pEntry->handler;
}

std::string RouteNode::patternString() const {
  vector<const RouteNode*> path;
  for (const RouteNode* pNode = this; pNode->_kind != Kind::Root; pNode = pNode->_parent) {
    path.push_back(pNode);
  }
  if (path.empty()) {
    return "/";
  }

  std::string out;
  for (auto it = path.rbegin(); it != path.rend(); ++it) {
    const RouteNode& node = **it;
    out.push_back('/');
    if (node.isParam()) {
      out.push_back('{');
      out.append(node._name);
      out.push_back('}');
    } else {
      out.append(node._name);
    }
  }
  return out;
}

}  // namespace pathmux
