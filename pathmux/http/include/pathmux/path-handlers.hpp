#pragma once

#include <functional>
#include <span>
#include <string_view>

#include "pathmux/http-method.hpp"
#include "pathmux/vector.hpp"

namespace pathmux {

class RequestContext;

// Request handler type: receives the context of the dispatched request and writes its response through it.
using RequestHandler = std::function<void(RequestContext&)>;

// Handler registered for one method key.
struct MethodHandler {
  http::MethodKey method;
  RequestHandler handler;
};

// Returns the handler registered for the request method, falling back to the handler registered for the Any key.
// Returns nullptr if there is none.
[[nodiscard]] const RequestHandler* FindMethodHandler(std::span<const MethodHandler> handlers,
                                                      std::string_view method) noexcept;

// Stores handler under the given key in handlers, replacing an existing one.
// Returns true if a handler was replaced.
bool AssignMethodHandler(vector<MethodHandler>& handlers, const http::MethodKey& method, RequestHandler handler);

}  // namespace pathmux
