#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "pathmux/city-hash.hpp"
#include "pathmux/flat-hash-map.hpp"
#include "pathmux/http-method-set.hpp"
#include "pathmux/http-method.hpp"
#include "pathmux/path-handlers.hpp"
#include "pathmux/vector.hpp"

namespace pathmux {

// One node of the routing trie, standing for a fixed sequence of segments from the root.
//
// Children are split in three groups: literal children keyed by their segment text, at most one parameter child and
// at most one slash child (the node of an empty segment, which is how "/a/" differs from "/a").
// The parent pointer is a non owning back reference, only used to walk up during catch-all resolution.
// Nodes are owned by the Router's node pool.
class RouteNode {
 public:
  enum class Kind : std::uint8_t { Root, Literal, Param, Slash };

  // Three-state catch-all entry: an absent entry is simply not stored.
  struct CatchAll {
    enum class Kind : std::uint8_t {
      Own,      // resolves to the endpoint handler of the node itself
      Explicit  // resolves to handler
    };

    http::MethodKey method;
    Kind kind;
    RequestHandler handler;  // empty for Kind::Own
  };

  // Creates a root node.
  RouteNode() = default;

  RouteNode(Kind kind, std::string_view name, RouteNode* parent, http::MethodSet allowedMethods);

  RouteNode(const RouteNode&) = delete;
  RouteNode(RouteNode&&) = delete;
  RouteNode& operator=(const RouteNode&) = delete;
  RouteNode& operator=(RouteNode&&) = delete;

  ~RouteNode() = default;

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  // Literal segment text or capture name. Empty for the root and slash nodes.
  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] bool isParam() const noexcept { return _kind == Kind::Param; }

  [[nodiscard]] const RouteNode* parent() const noexcept { return _parent; }

  // Union of the method sets of all patterns going through or ending at this node.
  [[nodiscard]] const http::MethodSet& allowedMethods() const noexcept { return _allowedMethods; }

  // Child matching the request segment literally: the slash child for an empty segment, a literal child otherwise.
  // The parameter child is never returned.
  [[nodiscard]] const RouteNode* literalChild(std::string_view segment) const noexcept;

  [[nodiscard]] const RouteNode* paramChild() const noexcept { return _paramChild; }

  [[nodiscard]] const RouteNode* slashChild() const noexcept { return _slashChild; }

  // Node whose catch-all covers requests failing below this node: the slash child ("/a/" for "/a"), or the root
  // itself for the root node. nullptr if there is none.
  [[nodiscard]] const RouteNode* directoryNode() const noexcept { return _kind == Kind::Root ? this : _slashChild; }

  // Endpoint handler for the request method (method specific first, then Any), or nullptr.
  [[nodiscard]] const RequestHandler* handler(std::string_view method) const noexcept {
    return FindMethodHandler(_handlers, method);
  }

  // Resolves the catch-all of this node for the request method: the entry registered for the method, else the one
  // registered for Any. An Own entry resolves to the node's endpoint handler for the method.
  // Returns nullptr if there is no entry or if it resolves to nothing.
  [[nodiscard]] const RequestHandler* catchAllHandler(std::string_view method) const noexcept;

  // Reconstructs the pattern leading to this node, for instance "/users/{id}/".
  [[nodiscard]] std::string patternString() const;

 private:
  friend class Router;
  friend class RouteEntry;

  // Keys view the name of the child node, which never moves.
  using LiteralChildren = flat_hash_map<std::string_view, RouteNode*, CityHash>;

  // Copies the handlers and catch-alls of other, but not its children.
  void copyHandlersFrom(const RouteNode& other);

  // Mutable child lookup used by registration, by segment kind and text.
  [[nodiscard]] RouteNode* child(Kind kind, std::string_view text) noexcept;

  void attachChild(RouteNode* child);

  void mergeAllowedMethods(const http::MethodSet& methods) { _allowedMethods.mergeFrom(methods); }

  // Returns true if a handler was replaced.
  bool setHandler(const http::MethodKey& method, RequestHandler handler) {
    return AssignMethodHandler(_handlers, method, std::move(handler));
  }

  // Returns true if a catch-all was replaced.
  bool setCatchAll(const http::MethodKey& method, CatchAll::Kind kind, RequestHandler handler);

  [[nodiscard]] const CatchAll* findCatchAll(std::string_view method) const noexcept;

  LiteralChildren _literalChildren;
  vector<MethodHandler> _handlers;
  vector<CatchAll> _catchAlls;
  http::MethodSet _allowedMethods;
  std::string _name;
  RouteNode* _parent{nullptr};
  RouteNode* _paramChild{nullptr};
  RouteNode* _slashChild{nullptr};
  Kind _kind{Kind::Root};
};

}  // namespace pathmux
